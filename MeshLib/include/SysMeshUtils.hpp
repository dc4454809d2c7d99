// SysMeshUtils.hpp
#pragma once

#include <cassert>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "SysMesh.hpp"

namespace smu // Sys mesh utilities
{

    /**
     * @brief Hash for canonical (sorted) IndexPair edges.
     *
     * Always hash edges normalized with SysMesh::sort_edge(). The two 32-bit
     * indices are packed into one 64-bit value.
     */
    struct IndexPairHash
    {
        size_t operator()(const IndexPair& e) const noexcept
        {
            assert(e.first <= e.second && "IndexPairHash requires sorted edges");

            const uint64_t a = static_cast<uint32_t>(e.first);
            const uint64_t b = static_cast<uint32_t>(e.second);
            return (a << 32) | b;
        }
    };

    /// Sorted edge -> polygons using it.
    using EdgePolyMap = std::unordered_map<IndexPair, SysEdgePolys, IndexPairHash>;

    /**
     * @brief Edge to polygon adjacency for the whole mesh, built in one pass.
     *
     * A polygon that runs over the same edge twice is listed once.
     * Repeated corners (a, a) are not edges and are left out.
     */
    [[nodiscard]] EdgePolyMap build_edge_polys(const SysMesh& mesh);

    /**
     * @return The number of distinct edges connected to every vertex, indexed by vertex.
     */
    [[nodiscard]] std::vector<uint32_t> vert_edge_counts(const SysMesh& mesh);

    /**
     * @return Sorted unique map vertex indices referenced by at least one mapped polygon.
     */
    [[nodiscard]] std::vector<int32_t> used_map_verts(const SysMesh& mesh, int32_t map);

} // namespace smu
