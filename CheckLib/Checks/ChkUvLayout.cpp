#include "ChkUvLayout.hpp"

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <vector>

#include "PolygonArea.hpp"
#include "SysMesh.hpp"
#include "SysMeshUtils.hpp"

namespace
{
    int32_t uv_map(const SysMesh& mesh) noexcept
    {
        const int32_t map = mesh.map_find(kSysUvMapId);
        return (map >= 0 && mesh.map_dim(map) >= 2) ? map : -1;
    }

    // Flags every referenced UV matching @p pred.
    void flag_uvs(const SysMeshId& id, const SysMesh& mesh, UvResult& result, auto pred)
    {
        const int32_t map = uv_map(mesh);
        if (map < 0)
            return;

        for (int32_t mv : smu::used_map_verts(mesh, map))
        {
            const float* uv = mesh.map_vert_position(map, mv);
            if (pred(double(uv[0]), double(uv[1])))
                result.flag(id, mv);
        }
    }

    // Nearest integer, so values just below a border count as well as values just above it.
    bool near_integer(double v, double tolerance) noexcept
    {
        return std::abs(v - std::round(v)) <= tolerance;
    }

    // True if [lo, hi] covers more than one unit tile. A span ending exactly on a
    // border does not reach into the next tile.
    bool spans_tiles(double lo, double hi) noexcept
    {
        const double first = std::floor(lo);
        const double last  = std::max(first, std::ceil(hi) - 1.0);
        return last > first;
    }
} // namespace

void ChkMissingUvs::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, PolygonResult& result) const
{
    const int32_t map = uv_map(mesh);
    for (int32_t poly = 0; poly < static_cast<int32_t>(mesh.num_polys()); ++poly)
    {
        if (map < 0 || !mesh.map_poly_valid(map, poly))
            result.flag(id, poly);
    }
}

void ChkUvRange::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, UvResult& result) const
{
    flag_uvs(id, mesh, result, [&](double u, double v) {
        return u < 0.0 || u > settings.uvRangeMaxU || v < 0.0;
    });
}

void ChkOnBorder::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, UvResult& result) const
{
    flag_uvs(id, mesh, result, [&](double u, double v) {
        return near_integer(u, settings.onBorderTolerance) || near_integer(v, settings.onBorderTolerance);
    });
}

void ChkCrossBorder::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, PolygonResult& result) const
{
    const int32_t map = uv_map(mesh);
    if (map < 0)
        return;

    for (int32_t poly = 0; poly < static_cast<int32_t>(mesh.num_polys()); ++poly)
    {
        const std::vector<glm::vec2> loop = geo::polyUvLoop(mesh, map, poly);
        if (loop.empty())
            continue;

        glm::dvec2 lo(loop.front());
        glm::dvec2 hi(loop.front());
        for (const glm::vec2& uv : loop)
        {
            lo = glm::min(lo, glm::dvec2(uv));
            hi = glm::max(hi, glm::dvec2(uv));
        }

        if (spans_tiles(lo.x, hi.x) || spans_tiles(lo.y, hi.y))
            result.flag(id, poly);
    }
}
