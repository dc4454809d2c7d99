#pragma once

#include <memory>
#include <string>
#include <vector>

class SysMesh;

/// Stable identity of a mesh inside a scene. Hosts use DAG style paths ("|group|mesh").
using SysMeshId = std::string;

/**
 * @brief Backend-agnostic scene interface handing out SysMesh snapshots.
 *
 * This is the boundary to whatever application owns the geometry. Checks never
 * talk to the host directly; the runner asks the scene for the mesh ids of a
 * scope, resolves each id to an immutable snapshot and hands that to the checks.
 *
 * Implementations must be safe to call from several threads at once for the
 * const queries below.
 */
class SysMeshScene
{
public:
    SysMeshScene();
    virtual ~SysMeshScene();

    /**
     * @return Ids of all meshes in the scene, in a stable order.
     */
    [[nodiscard]] virtual std::vector<SysMeshId> allMeshIds() const = 0;

    /**
     * @return Subset of meshes currently selected by the user.
     */
    [[nodiscard]] virtual std::vector<SysMeshId> selectedMeshIds() const = 0;

    /**
     * @return The mesh at @p root and every mesh below it.
     *
     * The default implementation treats ids as '|' separated paths and keeps the
     * ids equal to @p root or starting with "root|".
     */
    [[nodiscard]] virtual std::vector<SysMeshId> hierarchyMeshIds(const SysMeshId& root) const;

    /**
     * @brief Resolve a mesh id to an immutable geometry snapshot (object space).
     *
     * @return The snapshot, or nullptr if the id no longer refers to a mesh.
     * @throws std::runtime_error if the host fails while reading the geometry.
     */
    [[nodiscard]] virtual std::shared_ptr<const SysMesh> mesh(const SysMeshId& id) const = 0;

    /**
     * @return The scene's linear unit ("cm", "m", "in", ...).
     */
    [[nodiscard]] virtual std::string linearUnit() const = 0;

    /**
     * @return The material assigned to the mesh, or an empty string if none.
     */
    [[nodiscard]] virtual std::string shadingAssignment(const SysMeshId& id) const = 0;

    /**
     * @return True if a texture file exists at @p path. Defaults to a filesystem lookup.
     */
    [[nodiscard]] virtual bool textureFileExists(const std::string& path) const;
};
