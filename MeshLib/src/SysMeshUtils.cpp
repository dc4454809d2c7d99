#include "SysMeshUtils.hpp"

#include <algorithm>

namespace smu
{

    EdgePolyMap build_edge_polys(const SysMesh& mesh)
    {
        EdgePolyMap result;
        result.reserve(static_cast<size_t>(mesh.num_polys()) * 2);

        for (int32_t poly = 0; poly < static_cast<int32_t>(mesh.num_polys()); ++poly)
        {
            for (const IndexPair& e : mesh.poly_edges(poly))
            {
                if (e.first == e.second)
                    continue;

                SysEdgePolys& polys = result[SysMesh::sort_edge(e)];
                if (polys.empty() || polys.back() != poly)
                    polys.push_back(poly);
            }
        }

        return result;
    }

    std::vector<uint32_t> vert_edge_counts(const SysMesh& mesh)
    {
        std::vector<uint32_t> counts(mesh.num_verts(), 0);

        for (const IndexPair& e : mesh.all_edges())
        {
            ++counts[e.first];
            ++counts[e.second];
        }

        return counts;
    }

    std::vector<int32_t> used_map_verts(const SysMesh& mesh, int32_t map)
    {
        std::vector<int32_t> result;
        if (map < 0 || map >= mesh.num_maps())
            return result;

        for (int32_t poly = 0; poly < static_cast<int32_t>(mesh.num_polys()); ++poly)
        {
            if (!mesh.map_poly_valid(map, poly))
                continue;

            const SysPolyVerts& mpv = mesh.map_poly_verts(map, poly);
            result.insert(result.end(), mpv.begin(), mpv.end());
        }

        std::sort(result.begin(), result.end());
        result.erase(std::unique(result.begin(), result.end()), result.end());
        return result;
    }

} // namespace smu
