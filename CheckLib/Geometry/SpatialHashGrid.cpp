#include "SpatialHashGrid.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace
{
    // Keeps huge (or non-finite) coordinates on a valid cell instead of
    // overflowing the integer conversion.
    constexpr double kMaxCell = static_cast<double>(std::numeric_limits<int64_t>::max() / 4);

    int64_t to_cell(double v, double inv) noexcept
    {
        const double c = std::floor(v * inv);
        if (!std::isfinite(c))
            return std::isnan(c) ? 0 : (c > 0.0 ? int64_t(kMaxCell) : -int64_t(kMaxCell));

        return static_cast<int64_t>(std::clamp(c, -kMaxCell, kMaxCell));
    }
} // namespace

namespace geo
{

    size_t SpatialHashGrid::CellKeyHash::operator()(const CellKey& k) const noexcept
    {
        // Simple hash combine
        size_t h   = 1469598103934665603ull;
        auto   mix = [&](uint64_t v) {
            h ^= static_cast<size_t>(v) + 0x9e3779b9 + (h << 6) + (h >> 2);
        };
        mix(static_cast<uint64_t>(k.x));
        mix(static_cast<uint64_t>(k.y));
        mix(static_cast<uint64_t>(k.z));
        return h;
    }

    SpatialHashGrid::SpatialHashGrid(std::span<const glm::vec3> points, double tolerance)
        : m_points(points.begin(), points.end()),
          m_tolerance(tolerance > 0.0 ? tolerance : 0.0),
          m_cellSize(tolerance > 0.0 ? tolerance : 1.0)
    {
        m_cells.reserve(m_points.size());

        for (int32_t i = 0; i < static_cast<int32_t>(m_points.size()); ++i)
            m_cells[cellOf(m_points[i])].push_back(i);
    }

    SpatialHashGrid::CellKey SpatialHashGrid::cellOf(const glm::vec3& p) const noexcept
    {
        const double inv = 1.0 / m_cellSize;

        CellKey k;
        k.x = to_cell(p.x, inv);
        k.y = to_cell(p.y, inv);
        k.z = to_cell(p.z, inv);
        return k;
    }

    bool SpatialHashGrid::within(const glm::vec3& a, const glm::vec3& b) const noexcept
    {
        const double dx = double(a.x) - double(b.x);
        const double dy = double(a.y) - double(b.y);
        const double dz = double(a.z) - double(b.z);
        return dx * dx + dy * dy + dz * dz <= m_tolerance * m_tolerance;
    }

    std::vector<int32_t> SpatialHashGrid::queryCandidates(const glm::vec3& p) const
    {
        std::vector<int32_t> result;
        const CellKey        c = cellOf(p);

        for (int64_t dz = -1; dz <= 1; ++dz)
        {
            for (int64_t dy = -1; dy <= 1; ++dy)
            {
                for (int64_t dx = -1; dx <= 1; ++dx)
                {
                    const CellKey k{c.x + dx, c.y + dy, c.z + dz};

                    auto it = m_cells.find(k);
                    if (it == m_cells.end())
                        continue;

                    result.insert(result.end(), it->second.begin(), it->second.end());
                }
            }
        }

        return result;
    }

    std::vector<int32_t> SpatialHashGrid::queryNeighbors(const glm::vec3& p) const
    {
        std::vector<int32_t> result = queryCandidates(p);

        result.erase(std::remove_if(result.begin(),
                                    result.end(),
                                    [&](int32_t i) { return !within(m_points[i], p); }),
                     result.end());

        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<int32_t> SpatialHashGrid::neighborsOf(int32_t index) const
    {
        if (index < 0 || index >= static_cast<int32_t>(m_points.size()))
            return {};

        std::vector<int32_t> result = queryNeighbors(m_points[index]);
        result.erase(std::remove(result.begin(), result.end(), index), result.end());
        return result;
    }

    std::vector<std::pair<int32_t, int32_t>> SpatialHashGrid::overlappingPairs() const
    {
        std::vector<std::pair<int32_t, int32_t>> pairs;

        for (int32_t i = 0; i < static_cast<int32_t>(m_points.size()); ++i)
        {
            for (int32_t j : queryCandidates(m_points[i]))
            {
                if (j > i && within(m_points[i], m_points[j]))
                    pairs.emplace_back(i, j);
            }
        }

        std::sort(pairs.begin(), pairs.end());
        return pairs;
    }

    bool SpatialHashGrid::hasNeighbor(int32_t index) const noexcept
    {
        const glm::vec3& p = m_points[index];
        const CellKey    c = cellOf(p);

        for (int64_t dz = -1; dz <= 1; ++dz)
        {
            for (int64_t dy = -1; dy <= 1; ++dy)
            {
                for (int64_t dx = -1; dx <= 1; ++dx)
                {
                    auto it = m_cells.find(CellKey{c.x + dx, c.y + dy, c.z + dz});
                    if (it == m_cells.end())
                        continue;

                    for (int32_t j : it->second)
                    {
                        if (j != index && within(p, m_points[j]))
                            return true;
                    }
                }
            }
        }

        return false;
    }

    std::vector<int32_t> SpatialHashGrid::overlappingPoints() const
    {
        std::vector<int32_t> result;

        for (int32_t i = 0; i < static_cast<int32_t>(m_points.size()); ++i)
        {
            if (hasNeighbor(i))
                result.push_back(i);
        }

        return result;
    }

} // namespace geo
