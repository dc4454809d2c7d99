#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "SysMeshScene.hpp"
#include "SysObjLoader.hpp"

/**
 * @brief In-memory SysMeshScene.
 *
 * Holds immutable mesh snapshots keyed by DAG style ids, a selection, a linear
 * unit and per-mesh material assignments. OBJ files are imported one mesh per
 * object under "|<file stem>|<object>".
 *
 * The const queries may be called from several threads at once. Modifying the
 * scene while a run is in progress is not supported.
 */
class MeshScene final : public SysMeshScene
{
public:
    MeshScene();
    ~MeshScene() override;

    /**
     * @brief Add a mesh, or replace the mesh already stored under @p id.
     * @param material Name of the assigned material, empty for none.
     */
    void addMesh(const SysMeshId& id, std::shared_ptr<const SysMesh> mesh, const std::string& material = {});

    /// @return True if a mesh was removed. The id is also dropped from the selection.
    bool removeMesh(const SysMeshId& id);

    /**
     * @brief Import every object of an OBJ file.
     *
     * Objects end up under "|<file stem>|<object name>". Materials read from the
     * MTL library are added to materials().
     *
     * @return The ids of the imported meshes; empty if the file could not be read
     * (see @p report).
     */
    std::vector<SysMeshId> loadObj(const std::string& path, ObjLoadReport& report);

    /// Replace the selection. Ids that are not in the scene are kept and resolve to no mesh.
    void setSelection(std::vector<SysMeshId> ids);

    /// Select every mesh.
    void selectAll();

    void setLinearUnit(std::string unit);

    [[nodiscard]] size_t meshCount() const noexcept
    {
        return m_order.size();
    }

    [[nodiscard]] const ObjMaterials& materials() const noexcept
    {
        return m_materials;
    }

    // SysMeshScene
    [[nodiscard]] std::vector<SysMeshId>         allMeshIds() const override;
    [[nodiscard]] std::vector<SysMeshId>         selectedMeshIds() const override;
    [[nodiscard]] std::shared_ptr<const SysMesh> mesh(const SysMeshId& id) const override;
    [[nodiscard]] std::string                    linearUnit() const override;
    [[nodiscard]] std::string                    shadingAssignment(const SysMeshId& id) const override;

private:
    struct Record
    {
        std::shared_ptr<const SysMesh> mesh;
        std::string                    material;
    };

    std::unordered_map<SysMeshId, Record> m_meshes;
    std::vector<SysMeshId>                m_order;
    std::vector<SysMeshId>                m_selection;
    std::string                           m_unit = "cm";
    ObjMaterials                          m_materials;
};
