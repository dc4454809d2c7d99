#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace geo
{

    /**
     * @brief Uniform grid over a point set for near-duplicate queries.
     *
     * Cell size equals the tolerance, so two points within tolerance of each other
     * always sit in the same or in adjacent cells and a query only has to visit
     * the 27 cells around the query point.
     *
     * The grid is built once from a point set and is immutable afterwards; it is
     * safe to query from several threads.
     *
     * A tolerance <= 0 degrades to exact coincidence: unit cells are used and only
     * points at distance 0 match.
     */
    class SpatialHashGrid
    {
    public:
        SpatialHashGrid(std::span<const glm::vec3> points, double tolerance);

        /// @return Indices stored in the 27 cells around @p p (no distance test).
        [[nodiscard]] std::vector<int32_t> queryCandidates(const glm::vec3& p) const;

        /// @return Indices of points within tolerance of @p p (distance <= tolerance).
        [[nodiscard]] std::vector<int32_t> queryNeighbors(const glm::vec3& p) const;

        /// @return queryNeighbors() for point @p index, without @p index itself.
        [[nodiscard]] std::vector<int32_t> neighborsOf(int32_t index) const;

        /**
         * @brief Every pair (i, j), i < j, of points within tolerance of each other.
         *
         * Each pair is reported once; pairs are sorted. No clustering: in a chain
         * a-b-c with only a-b and b-c in range, (a, c) is not reported.
         *
         * The output grows with the square of the cluster size: k stacked points
         * give k * (k - 1) / 2 pairs. Use overlappingPoints() when only the
         * points matter.
         */
        [[nodiscard]] std::vector<std::pair<int32_t, int32_t>> overlappingPairs() const;

        /**
         * @brief Sorted indices of every point with at least one other point within tolerance.
         *
         * Stops at the first match per point and never materializes pairs, so
         * memory stays linear in the point count however dense a cluster is.
         */
        [[nodiscard]] std::vector<int32_t> overlappingPoints() const;

        [[nodiscard]] size_t size() const noexcept
        {
            return m_points.size();
        }

        [[nodiscard]] double tolerance() const noexcept
        {
            return m_tolerance;
        }

        [[nodiscard]] double cellSize() const noexcept
        {
            return m_cellSize;
        }

    private:
        struct CellKey
        {
            int64_t x = 0;
            int64_t y = 0;
            int64_t z = 0;

            bool operator==(const CellKey& o) const noexcept
            {
                return x == o.x && y == o.y && z == o.z;
            }
        };

        struct CellKeyHash
        {
            size_t operator()(const CellKey& k) const noexcept;
        };

        [[nodiscard]] CellKey cellOf(const glm::vec3& p) const noexcept;
        [[nodiscard]] bool    within(const glm::vec3& a, const glm::vec3& b) const noexcept;
        [[nodiscard]] bool    hasNeighbor(int32_t index) const noexcept;

        std::vector<glm::vec3>                                         m_points;
        double                                                         m_tolerance = 0.0;
        double                                                         m_cellSize  = 1.0;
        std::unordered_map<CellKey, std::vector<int32_t>, CellKeyHash> m_cells;
    };

} // namespace geo
