#include "PolygonArea.hpp"

#include <cmath>
#include <glm/glm.hpp>

#include "SysMesh.hpp"

namespace geo
{

    double polygonArea3D(std::span<const glm::vec3> points) noexcept
    {
        const size_t n = points.size();
        if (n < 3)
            return 0.0;

        // Relative to the first corner to keep precision far from the origin.
        const glm::dvec3 origin(points[0]);

        glm::dvec3 sum(0.0);
        for (size_t prev = n - 1, next = 0; next < n; prev = next++)
        {
            const glm::dvec3 a = glm::dvec3(points[prev]) - origin;
            const glm::dvec3 b = glm::dvec3(points[next]) - origin;
            sum += glm::cross(a, b);
        }

        return 0.5 * glm::length(sum);
    }

    double polygonAreaUV(std::span<const glm::vec2> uvs) noexcept
    {
        const size_t n = uvs.size();
        if (n < 3)
            return 0.0;

        double twice = 0.0;
        for (size_t prev = n - 1, next = 0; next < n; prev = next++)
        {
            twice += double(uvs[prev].x) * double(uvs[next].y) - double(uvs[next].x) * double(uvs[prev].y);
        }

        return 0.5 * std::abs(twice);
    }

    double polyArea(const SysMesh& mesh, int32_t poly)
    {
        if (!mesh.poly_valid(poly))
            return 0.0;

        std::vector<glm::vec3> points;
        points.reserve(mesh.poly_verts(poly).size());
        for (int32_t v : mesh.poly_verts(poly))
            points.push_back(mesh.vert_position(v));

        return polygonArea3D(points);
    }

    std::vector<glm::vec2> polyUvLoop(const SysMesh& mesh, int32_t map, int32_t poly)
    {
        std::vector<glm::vec2> loop;
        if (!mesh.map_poly_valid(map, poly) || mesh.map_dim(map) < 2)
            return loop;

        const SysPolyVerts& mpv = mesh.map_poly_verts(map, poly);
        loop.reserve(mpv.size());
        for (int32_t mv : mpv)
        {
            const float* uv = mesh.map_vert_position(map, mv);
            loop.emplace_back(uv[0], uv[1]);
        }

        return loop;
    }

    double polyUvArea(const SysMesh& mesh, int32_t map, int32_t poly)
    {
        return polygonAreaUV(polyUvLoop(mesh, map, poly));
    }

} // namespace geo
