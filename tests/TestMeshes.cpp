#include "TestMeshes.hpp"

namespace tst
{

    int32_t appendCube(SysMesh& mesh, const glm::vec3& center, float size)
    {
        const float h = size * 0.5f;

        const int32_t v0 = mesh.create_vert(center + glm::vec3(-h, -h, -h));
        const int32_t v1 = mesh.create_vert(center + glm::vec3(h, -h, -h));
        const int32_t v2 = mesh.create_vert(center + glm::vec3(h, h, -h));
        const int32_t v3 = mesh.create_vert(center + glm::vec3(-h, h, -h));
        const int32_t v4 = mesh.create_vert(center + glm::vec3(-h, -h, h));
        const int32_t v5 = mesh.create_vert(center + glm::vec3(h, -h, h));
        const int32_t v6 = mesh.create_vert(center + glm::vec3(h, h, h));
        const int32_t v7 = mesh.create_vert(center + glm::vec3(-h, h, h));

        const int32_t first = mesh.create_poly({v0, v3, v2, v1}); // -Z
        mesh.create_poly({v4, v5, v6, v7});                       // +Z
        mesh.create_poly({v0, v1, v5, v4});                       // -Y
        mesh.create_poly({v3, v7, v6, v2});                       // +Y
        mesh.create_poly({v0, v4, v7, v3});                       // -X
        mesh.create_poly({v1, v2, v6, v5});                       // +X
        return first;
    }

    std::shared_ptr<SysMesh> makeCube(const glm::vec3& center, float size)
    {
        auto mesh = std::make_shared<SysMesh>();
        appendCube(*mesh, center, size);
        return mesh;
    }

    std::shared_ptr<SysMesh> makeGrid(int nx, int ny, float cell)
    {
        auto mesh = std::make_shared<SysMesh>();

        for (int y = 0; y <= ny; ++y)
            for (int x = 0; x <= nx; ++x)
                mesh->create_vert(glm::vec3(x * cell, y * cell, 0.f));

        auto index = [nx](int x, int y) { return static_cast<int32_t>(y * (nx + 1) + x); };

        for (int y = 0; y < ny; ++y)
            for (int x = 0; x < nx; ++x)
                mesh->create_poly({index(x, y), index(x + 1, y), index(x + 1, y + 1), index(x, y + 1)});

        return mesh;
    }

    std::shared_ptr<SysMesh> makePolygon(const std::vector<glm::vec3>& points)
    {
        auto         mesh = std::make_shared<SysMesh>();
        SysPolyVerts pv;
        for (const glm::vec3& p : points)
            pv.push_back(mesh->create_vert(p));
        mesh->create_poly(pv);
        return mesh;
    }

    int32_t addPlanarUvs(SysMesh& mesh, float scale)
    {
        int32_t map = mesh.map_find(kSysUvMapId);
        if (map < 0)
            map = mesh.map_create(kSysUvMapId, 0, 2);

        for (int32_t poly = 0; poly < static_cast<int32_t>(mesh.num_polys()); ++poly)
        {
            SysPolyVerts mpv;
            for (int32_t v : mesh.poly_verts(poly))
            {
                const glm::vec3& p     = mesh.vert_position(v);
                const float      uv[2] = {p.x * scale, p.y * scale};
                mpv.push_back(mesh.map_create_vert(map, uv));
            }
            mesh.map_create_poly(map, poly, mpv);
        }

        return map;
    }

    int32_t setPolyUvs(SysMesh& mesh, int32_t poly, const std::vector<glm::vec2>& uvs)
    {
        int32_t map = mesh.map_find(kSysUvMapId);
        if (map < 0)
            map = mesh.map_create(kSysUvMapId, 0, 2);

        SysPolyVerts mpv;
        for (const glm::vec2& uv : uvs)
        {
            const float vec[2] = {uv.x, uv.y};
            mpv.push_back(mesh.map_create_vert(map, vec));
        }
        mesh.map_create_poly(map, poly, mpv);

        return map;
    }

} // namespace tst
