#include "SysMesh.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstring>
#include <glm/common.hpp>
#include <glm/glm.hpp>

#include "SysMeshData.hpp"

SysMesh::SysMesh() : data{std::make_shared<SysMeshData>()}
{
}

SysMesh::SysMesh(SysMesh&& other) noexcept
    : data{std::move(other.data)}
{
}

SysMesh& SysMesh::operator=(SysMesh&& other) noexcept
{
    if (this != &other)
        data = std::move(other.data);
    return *this;
}

SysMesh::~SysMesh() = default;

/// -------------------------------------------------------
/// Vertices
/// -------------------------------------------------------

uint32_t SysMesh::num_verts() const noexcept
{
    return static_cast<uint32_t>(data->positions.size());
}

int32_t SysMesh::create_vert(const glm::vec3& pos)
{
    const int32_t vert_index = static_cast<int32_t>(data->positions.size());

    if (data->positions.empty())
    {
        data->bbox_min = pos;
        data->bbox_max = pos;
    }
    else
    {
        data->bbox_min = glm::min(data->bbox_min, pos);
        data->bbox_max = glm::max(data->bbox_max, pos);
    }

    data->positions.push_back(pos);
    return vert_index;
}

const glm::vec3& SysMesh::vert_position(int32_t vert_index) const noexcept
{
    assert(vert_valid(vert_index) && "Invalid vertex index!");
    return data->positions[vert_index];
}

std::span<const glm::vec3> SysMesh::vert_positions() const noexcept
{
    return data->positions;
}

bool SysMesh::vert_valid(int32_t vert_index) const noexcept
{
    return vert_index >= 0 && vert_index < static_cast<int32_t>(data->positions.size());
}

/// -------------------------------------------------------
/// Edges
/// -------------------------------------------------------

std::vector<IndexPair> SysMesh::all_edges() const
{
    std::vector<IndexPair> edges;
    edges.reserve(static_cast<size_t>(num_polys()) * 4);

    for (int32_t poly_index = 0; poly_index < static_cast<int32_t>(num_polys()); ++poly_index)
    {
        for (const IndexPair& e : poly_edges(poly_index))
        {
            // A repeated corner (a, a) is not an edge.
            if (e.first != e.second)
                edges.push_back(sort_edge(e));
        }
    }

    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());

    return edges;
}

IndexPair SysMesh::sort_edge(const IndexPair& edge) noexcept
{
    return edge.first < edge.second ? edge : IndexPair(edge.second, edge.first);
}

/// -------------------------------------------------------
/// Polys
/// -------------------------------------------------------

uint32_t SysMesh::num_polys() const noexcept
{
    return static_cast<uint32_t>(data->polys.size());
}

int32_t SysMesh::create_poly(const SysPolyVerts& verts)
{
    for (int32_t v : verts)
    {
        if (!vert_valid(v))
            return -1;
    }

    SysPoly new_poly{};
    new_poly.verts           = verts;
    const int32_t poly_index = static_cast<int32_t>(data->polys.size());
    data->polys.push_back(std::move(new_poly));

    // Keep every map's polygon table the same size as the mesh's.
    for (const auto& mesh_map : data->mesh_maps)
        mesh_map->polys.resize(data->polys.size());

    return poly_index;
}

void SysMesh::reverse_poly(int32_t poly_index) noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    SysPolyVerts& pv = data->polys[poly_index].verts;
    std::reverse(pv.begin(), pv.end());

    for (const auto& mesh_map : data->mesh_maps)
    {
        SysPolyVerts& mpv = mesh_map->polys[poly_index].verts;
        std::reverse(mpv.begin(), mpv.end());
    }
}

const SysPolyVerts& SysMesh::poly_verts(int32_t poly_index) const noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    return data->polys[poly_index].verts;
}

SysPolyEdges SysMesh::poly_edges(int32_t poly_index) const
{
    SysPolyEdges   results;
    const SysPoly& poly = data->polys[poly_index];
    const int      n    = static_cast<int>(poly.verts.size());
    results.reserve(poly.verts.size());
    for (int prev = n - 1, next = 0; next < n; prev = next++)
    {
        results.push_back(IndexPair(poly.verts[prev], poly.verts[next]));
    }
    return results;
}

glm::vec3 SysMesh::poly_normal(int32_t poly_index) const noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    const SysPoly& poly = data->polys[poly_index];
    const int      n    = static_cast<int>(poly.verts.size());
    glm::vec3      norm(0.f);
    for (int prev = n - 1, next = 0; next < n; prev = next++)
    {
        const glm::vec3& prev_pos = data->positions[poly.verts[prev]];
        const glm::vec3& next_pos = data->positions[poly.verts[next]];
        norm[0] += (prev_pos[1] - next_pos[1]) * (prev_pos[2] + next_pos[2]);
        norm[1] += (prev_pos[2] - next_pos[2]) * (prev_pos[0] + next_pos[0]);
        norm[2] += (prev_pos[0] - next_pos[0]) * (prev_pos[1] + next_pos[1]);
    }

    // Safe normalize (no NaNs)
    const float len2 = glm::dot(norm, norm);
    if (len2 < 1e-20f)
        return glm::vec3(0.0f);

    return norm / std::sqrt(len2);
}

glm::vec3 SysMesh::poly_center(int32_t poly_index) const noexcept
{
    const SysPolyVerts& pv = poly_verts(poly_index);
    if (pv.empty())
        return glm::vec3(0.f);

    glm::vec3 pos(0.f);
    for (int32_t v : pv)
    {
        pos += vert_position(v);
    }
    return pos / static_cast<float>(pv.size());
}

bool SysMesh::poly_valid(int32_t poly_index) const noexcept
{
    return poly_index >= 0 && poly_index < static_cast<int32_t>(data->polys.size());
}

/// -------------------------------------------------------
/// Bounds
/// -------------------------------------------------------

glm::vec3 SysMesh::bounding_box_min() const noexcept
{
    return data->bbox_min;
}

glm::vec3 SysMesh::bounding_box_max() const noexcept
{
    return data->bbox_max;
}

glm::vec3 SysMesh::bounding_box_center() const noexcept
{
    return (data->bbox_min + data->bbox_max) * 0.5f;
}

/// -------------------------------------------------------
/// Maps
/// -------------------------------------------------------

int32_t SysMesh::map_create(int32_t id, int32_t type, int32_t dim)
{
    auto new_map  = std::make_shared<SysMeshMap>();
    new_map->id   = id;
    new_map->type = type;
    new_map->dim  = std::clamp(dim, 1, 4);

    // Make the number of polygons in the map match the mesh.
    new_map->polys.resize(data->polys.size(), SysMapPoly());

    data->mesh_maps.push_back(std::move(new_map));
    return static_cast<int32_t>(data->mesh_maps.size()) - 1;
}

int32_t SysMesh::map_find(int32_t id) const noexcept
{
    for (int32_t i = 0; i < static_cast<int32_t>(data->mesh_maps.size()); ++i)
    {
        if (data->mesh_maps[i]->id == id)
            return i;
    }
    return -1;
}

int32_t SysMesh::num_maps() const noexcept
{
    return static_cast<int32_t>(data->mesh_maps.size());
}

int32_t SysMesh::map_dim(int32_t map) const noexcept
{
    return data->mesh_maps[map]->dim;
}

bool SysMesh::map_create_poly(int32_t map, int32_t poly_index, const SysPolyVerts& pv)
{
    if (map < 0 || map >= num_maps() || !poly_valid(poly_index))
        return false;

    SysMeshMap& mesh_map = *data->mesh_maps[map];
    if (data->polys[poly_index].verts.size() != pv.size())
        return false;

    for (int32_t mv : pv)
    {
        if (mv < 0 || mv >= static_cast<int32_t>(mesh_map.verts.size()))
            return false;
    }

    mesh_map.polys[poly_index].verts = pv;
    return true;
}

int32_t SysMesh::map_create_vert(int32_t map, const float* vec)
{
    SysMeshMap& mesh_map = *data->mesh_maps[map];
    SysMapVert  new_vert{};

    std::memcpy(new_vert.vec, vec, mesh_map.dim * sizeof(float));

    const int32_t index = static_cast<int32_t>(mesh_map.verts.size());
    mesh_map.verts.push_back(new_vert);
    return index;
}

bool SysMesh::map_poly_valid(int32_t map, int32_t poly_index) const noexcept
{
    if (map < 0 || map >= num_maps())
        return false;

    if (!poly_valid(poly_index))
        return false;

    const SysMeshMap& mp = *data->mesh_maps[map];
    if (poly_index >= static_cast<int32_t>(mp.polys.size()))
        return false;

    return !mp.polys[poly_index].verts.empty();
}

const SysPolyVerts& SysMesh::map_poly_verts(int32_t map, int32_t poly) const noexcept
{
    assert(poly_valid(poly) && "nth polygon does not exist!");
    return data->mesh_maps[map]->polys[poly].verts;
}

const float* SysMesh::map_vert_position(int32_t map, int32_t n) const noexcept
{
    return data->mesh_maps[map]->verts[n].vec;
}
