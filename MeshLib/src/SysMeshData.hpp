#ifndef SYS_MESH_DATA_HPP_INCLUDED
#define SYS_MESH_DATA_HPP_INCLUDED

#include <cstdint>
#include <glm/vec3.hpp>
#include <memory>
#include <vector>

#include "SysMesh.hpp"

struct SysPoly
{
    SysPolyVerts verts;
};

struct SysMapVert
{
    SysMapVert() : vec{0.f, 0.f, 0.f, 0.f}
    {
    }
    float vec[4];
};

struct SysMapPoly
{
    SysPolyVerts verts;
};

struct SysMeshMap
{
    SysMeshMap() : id(-1), type(-1), dim(0)
    {
    }
    int32_t                 id;
    int32_t                 type;
    int32_t                 dim;
    std::vector<SysMapVert> verts;
    std::vector<SysMapPoly> polys;
};

struct SysMeshData
{
    std::vector<glm::vec3> positions;

    std::vector<SysPoly> polys;

    std::vector<std::shared_ptr<SysMeshMap>> mesh_maps;

    /// Bounds, kept current on every vertex create so const queries never write.
    glm::vec3 bbox_min{0.f};
    glm::vec3 bbox_max{0.f};
};

#endif
