#include "ChkTopology.hpp"

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <map>
#include <vector>

#include "PolygonArea.hpp"
#include "SysMesh.hpp"
#include "SysMeshUtils.hpp"

namespace
{
    int32_t poly_count(const SysMesh& mesh) noexcept
    {
        return static_cast<int32_t>(mesh.num_polys());
    }

    void flag_polys_by_size(const SysMeshId& id, const SysMesh& mesh, PolygonResult& result, auto pred)
    {
        for (int32_t poly = 0; poly < poly_count(mesh); ++poly)
        {
            if (pred(mesh.poly_verts(poly).size()))
                result.flag(id, poly);
        }
    }

    bool is_concave(const SysMesh& mesh, int32_t poly)
    {
        const SysPolyVerts& pv = mesh.poly_verts(poly);
        const size_t        n  = pv.size();
        if (n < 4)
            return false;

        const glm::dvec3 normal(mesh.poly_normal(poly));
        if (glm::dot(normal, normal) == 0.0)
            return false;

        bool left  = false;
        bool right = false;

        for (size_t i = 0; i < n; ++i)
        {
            const glm::dvec3 prev(mesh.vert_position(pv[(i + n - 1) % n]));
            const glm::dvec3 curr(mesh.vert_position(pv[i]));
            const glm::dvec3 next(mesh.vert_position(pv[(i + 1) % n]));

            const glm::dvec3 a = curr - prev;
            const glm::dvec3 b = next - curr;

            // Collinear corners do not turn.
            const double turn = glm::dot(glm::cross(a, b), normal);
            const double eps  = 1e-9 * glm::length(a) * glm::length(b);
            if (turn > eps)
                left = true;
            else if (turn < -eps)
                right = true;
        }

        return left && right;
    }

    // Normal map vertex at the corner of @p poly on @p vert, -1 when not found.
    int32_t corner_map_vert(const SysMesh& mesh, int32_t map, int32_t poly, int32_t vert)
    {
        const SysPolyVerts& pv = mesh.poly_verts(poly);
        const auto          it = std::find(pv.begin(), pv.end(), vert);
        if (it == pv.end())
            return -1;

        return mesh.map_poly_verts(map, poly)[static_cast<size_t>(it - pv.begin())];
    }

    bool same_normal(const SysMesh& mesh, int32_t map, int32_t a, int32_t b)
    {
        if (a == b)
            return true;

        const glm::vec3 na = glm::make_vec3(mesh.map_vert_position(map, a));
        const glm::vec3 nb = glm::make_vec3(mesh.map_vert_position(map, b));
        return glm::all(glm::lessThanEqual(glm::abs(na - nb), glm::vec3(1e-6f)));
    }

    double cross2(const glm::dvec2& a, const glm::dvec2& b) noexcept
    {
        return a.x * b.y - a.y * b.x;
    }

    double signed_area(const std::vector<glm::dvec2>& pts) noexcept
    {
        double area = 0.0;
        for (size_t i = 0, n = pts.size(); i < n; ++i)
            area += cross2(pts[i], pts[(i + 1) % n]);
        return area * 0.5;
    }

    // Keeps the part of the convex @p region on the left of a -> b.
    std::vector<glm::dvec2> clip_left(const std::vector<glm::dvec2>& region, const glm::dvec2& a, const glm::dvec2& b)
    {
        std::vector<glm::dvec2> out;
        out.reserve(region.size() + 1);

        const glm::dvec2 dir = b - a;
        for (size_t i = 0, n = region.size(); i < n; ++i)
        {
            const glm::dvec2& cur = region[i];
            const glm::dvec2& nxt = region[(i + 1) % n];

            const double dc = cross2(dir, cur - a);
            const double dn = cross2(dir, nxt - a);

            if (dc >= 0.0)
                out.push_back(cur);
            if ((dc > 0.0 && dn < 0.0) || (dc < 0.0 && dn > 0.0))
                out.push_back(cur + (nxt - cur) * (dc / (dc - dn)));
        }

        return out;
    }

    bool is_starlike(const SysMesh& mesh, int32_t poly)
    {
        const SysPolyVerts& pv = mesh.poly_verts(poly);
        if (pv.size() < 4)
            return true;

        const glm::dvec3 normal(mesh.poly_normal(poly));
        if (glm::dot(normal, normal) == 0.0)
            return true;

        // Drop the dominant normal axis.
        const glm::dvec3 an   = glm::abs(normal);
        const int        axis = an.x >= an.y && an.x >= an.z ? 0 : (an.y >= an.z ? 1 : 2);
        const int        u    = (axis + 1) % 3;
        const int        v    = (axis + 2) % 3;

        std::vector<glm::dvec2> pts;
        pts.reserve(pv.size());
        for (int32_t vert : pv)
        {
            const glm::dvec3 p(mesh.vert_position(vert));
            pts.emplace_back(p[u], p[v]);
        }

        const double area = signed_area(pts);
        if (area == 0.0)
            return true;
        if (area < 0.0)
            std::reverse(pts.begin(), pts.end());

        glm::dvec2 lo = pts.front();
        glm::dvec2 hi = pts.front();
        for (const glm::dvec2& p : pts)
        {
            lo = glm::min(lo, p);
            hi = glm::max(hi, p);
        }

        std::vector<glm::dvec2> kernel = {lo, {hi.x, lo.y}, hi, {lo.x, hi.y}};
        for (size_t i = 0, n = pts.size(); i < n && kernel.size() >= 3; ++i)
            kernel = clip_left(kernel, pts[i], pts[(i + 1) % n]);

        return kernel.size() >= 3 && signed_area(kernel) > 1e-9 * std::abs(area);
    }
} // namespace

void ChkTriangles::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, PolygonResult& result) const
{
    flag_polys_by_size(id, mesh, result, [](size_t n) { return n == 3; });
}

void ChkNgons::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, PolygonResult& result) const
{
    flag_polys_by_size(id, mesh, result, [](size_t n) { return n > 4; });
}

void ChkPoles::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, VertexResult& result) const
{
    const std::vector<uint32_t> counts = smu::vert_edge_counts(mesh);

    for (int32_t vert = 0; vert < static_cast<int32_t>(counts.size()); ++vert)
    {
        if (static_cast<int64_t>(counts[vert]) > settings.poleEdgeLimit)
            result.flag(id, vert);
    }
}

void ChkLamina::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, PolygonResult& result) const
{
    // Sorted vertex set -> faces using exactly that set.
    std::map<SysPolyVerts, std::vector<int32_t>> by_verts;

    for (int32_t poly = 0; poly < poly_count(mesh); ++poly)
    {
        SysPolyVerts key = mesh.poly_verts(poly);
        std::sort(key.begin(), key.end());
        key.erase(std::unique(key.begin(), key.end()), key.end());

        if (key.size() < 3)
            continue;

        by_verts[std::move(key)].push_back(poly);
    }

    for (const auto& [verts, polys] : by_verts)
    {
        if (polys.size() < 2)
            continue;

        for (int32_t poly : polys)
            result.flag(id, poly);
    }
}

void ChkZeroAreaFaces::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const
{
    for (int32_t poly = 0; poly < poly_count(mesh); ++poly)
    {
        if (geo::polyArea(mesh, poly) <= settings.zeroAreaTolerance)
            result.flag(id, poly);
    }
}

void ChkZeroLengthEdges::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, EdgeResult& result) const
{
    for (const IndexPair& e : mesh.all_edges())
    {
        const double len = glm::length(glm::dvec3(mesh.vert_position(e.first)) - glm::dvec3(mesh.vert_position(e.second)));
        if (len <= settings.zeroLengthTolerance)
            result.flag(id, e);
    }
}

void ChkOpenEdges::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, EdgeResult& result) const
{
    for (const auto& [edge, polys] : smu::build_edge_polys(mesh))
    {
        if (polys.size() < 2)
            result.flag(id, edge);
    }
}

void ChkNonManifoldEdges::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, EdgeResult& result) const
{
    for (const auto& [edge, polys] : smu::build_edge_polys(mesh))
    {
        if (polys.size() > 2)
            result.flag(id, edge);
    }
}

void ChkConcaveFaces::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, PolygonResult& result) const
{
    for (int32_t poly = 0; poly < poly_count(mesh); ++poly)
    {
        if (is_concave(mesh, poly))
            result.flag(id, poly);
    }
}

void ChkHardEdges::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, EdgeResult& result) const
{
    const int32_t map = mesh.map_find(kSysNormalMapId);
    if (map < 0)
        return;

    for (const auto& [edge, polys] : smu::build_edge_polys(mesh))
    {
        if (polys.size() != 2)
            continue;

        const int32_t p = polys[0];
        const int32_t q = polys[1];
        if (!mesh.map_poly_valid(map, p) || !mesh.map_poly_valid(map, q))
            continue;

        for (int32_t vert : {edge.first, edge.second})
        {
            const int32_t a = corner_map_vert(mesh, map, p, vert);
            const int32_t b = corner_map_vert(mesh, map, q, vert);
            if (a >= 0 && b >= 0 && !same_normal(mesh, map, a, b))
            {
                result.flag(id, edge);
                break;
            }
        }
    }
}

void ChkStarlike::evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& /*settings*/, PolygonResult& result) const
{
    for (int32_t poly = 0; poly < poly_count(mesh); ++poly)
    {
        if (!is_starlike(mesh, poly))
            result.flag(id, poly);
    }
}
