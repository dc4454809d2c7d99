#include "MeshScene.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <utility>

#include "SysMesh.hpp"

MeshScene::MeshScene() = default;

MeshScene::~MeshScene() = default;

void MeshScene::addMesh(const SysMeshId& id, std::shared_ptr<const SysMesh> mesh, const std::string& material)
{
    if (!m_meshes.contains(id))
        m_order.push_back(id);

    m_meshes[id] = Record{std::move(mesh), material};
}

bool MeshScene::removeMesh(const SysMeshId& id)
{
    if (m_meshes.erase(id) == 0)
        return false;

    std::erase(m_order, id);
    std::erase(m_selection, id);
    return true;
}

std::vector<SysMeshId> MeshScene::loadObj(const std::string& path, ObjLoadReport& report)
{
    std::vector<ObjObject> objects;
    ObjMaterials           materials;

    if (!loadObjObjects(path, objects, materials, report))
    {
        for (const std::string& err : report.errors)
            std::cerr << "MeshScene::loadObj(): " << err << "\n";
        return {};
    }

    for (const std::string& warn : report.warnings)
        std::cerr << "MeshScene::loadObj(): " << path << ": " << warn << "\n";

    // Merge materials by name; the first definition wins.
    for (ObjMaterial& mat : materials)
    {
        const bool known = std::ranges::any_of(m_materials, [&](const ObjMaterial& m) { return m.name == mat.name; });
        if (!known)
            m_materials.push_back(std::move(mat));
    }

    const std::string stem = std::filesystem::path(path).stem().string();

    std::vector<SysMeshId> ids;
    ids.reserve(objects.size());
    for (ObjObject& obj : objects)
    {
        SysMeshId id = "|" + stem + "|" + obj.name;
        addMesh(id, std::move(obj.mesh), obj.material);
        ids.push_back(std::move(id));
    }

    return ids;
}

void MeshScene::setSelection(std::vector<SysMeshId> ids)
{
    m_selection = std::move(ids);
}

void MeshScene::selectAll()
{
    m_selection = m_order;
}

void MeshScene::setLinearUnit(std::string unit)
{
    m_unit = std::move(unit);
}

std::vector<SysMeshId> MeshScene::allMeshIds() const
{
    return m_order;
}

std::vector<SysMeshId> MeshScene::selectedMeshIds() const
{
    return m_selection;
}

std::shared_ptr<const SysMesh> MeshScene::mesh(const SysMeshId& id) const
{
    if (auto it = m_meshes.find(id); it != m_meshes.end())
        return it->second.mesh;

    return nullptr;
}

std::string MeshScene::linearUnit() const
{
    return m_unit;
}

std::string MeshScene::shadingAssignment(const SysMeshId& id) const
{
    if (auto it = m_meshes.find(id); it != m_meshes.end())
        return it->second.material;

    return {};
}
