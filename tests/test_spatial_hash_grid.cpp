#include <gtest/gtest.h>

#include <algorithm>
#include <glm/glm.hpp>
#include <random>
#include <vector>

#include "SpatialHashGrid.hpp"

namespace
{
    std::vector<int32_t> brute_force_neighbors(const std::vector<glm::vec3>& points, int32_t i, double tol)
    {
        std::vector<int32_t> out;
        for (int32_t j = 0; j < static_cast<int32_t>(points.size()); ++j)
        {
            if (j == i)
                continue;

            const glm::dvec3 d = glm::dvec3(points[i]) - glm::dvec3(points[j]);
            if (glm::dot(d, d) <= tol * tol)
                out.push_back(j);
        }
        return out;
    }

    std::vector<glm::vec3> random_cloud(size_t n, float extent, unsigned seed)
    {
        std::mt19937                          rng(seed);
        std::uniform_real_distribution<float> dist(-extent, extent);

        std::vector<glm::vec3> points;
        points.reserve(n);
        for (size_t i = 0; i < n; ++i)
            points.emplace_back(dist(rng), dist(rng), dist(rng));

        // Some exact and near duplicates.
        for (size_t i = 0; i < n / 10; ++i)
        {
            points.push_back(points[i]);
            points.push_back(points[i] + glm::vec3(0.01f, 0.f, -0.01f));
        }
        return points;
    }
} // namespace

TEST(SpatialHashGrid, NeighborsMatchBruteForce)
{
    for (const double tol : {0.02, 0.05, 0.2})
    {
        const std::vector<glm::vec3> points = random_cloud(600, 1.f, 7u);
        const geo::SpatialHashGrid   grid(points, tol);

        for (int32_t i = 0; i < static_cast<int32_t>(points.size()); ++i)
            ASSERT_EQ(grid.neighborsOf(i), brute_force_neighbors(points, i, tol)) << "point " << i << " tol " << tol;
    }
}

TEST(SpatialHashGrid, PairsMatchBruteForce)
{
    const std::vector<glm::vec3> points = random_cloud(300, 2.f, 11u);
    const double                 tol    = 0.1;
    const geo::SpatialHashGrid   grid(points, tol);

    std::vector<std::pair<int32_t, int32_t>> expected;
    for (int32_t i = 0; i < static_cast<int32_t>(points.size()); ++i)
        for (int32_t j : brute_force_neighbors(points, i, tol))
            if (j > i)
                expected.emplace_back(i, j);

    EXPECT_EQ(grid.overlappingPairs(), expected);
}

TEST(SpatialHashGrid, OverlappingPointsMatchBruteForce)
{
    for (const double tol : {0.0, 0.05, 0.1})
    {
        const std::vector<glm::vec3> points = random_cloud(400, 2.f, 19u);
        const geo::SpatialHashGrid   grid(points, tol);

        std::vector<int32_t> expected;
        for (int32_t i = 0; i < static_cast<int32_t>(points.size()); ++i)
            if (!brute_force_neighbors(points, i, tol).empty())
                expected.push_back(i);

        EXPECT_EQ(grid.overlappingPoints(), expected) << "tol " << tol;
    }
}

TEST(SpatialHashGrid, StackedClusterReportsEveryPoint)
{
    std::vector<glm::vec3> points(100000, glm::vec3(0.25f, -3.f, 7.f));
    points.emplace_back(100.f, 0.f, 0.f);
    const geo::SpatialHashGrid grid(points, 0.0001);

    const std::vector<int32_t> stacked = grid.overlappingPoints();
    ASSERT_EQ(stacked.size(), 100000u);
    EXPECT_EQ(stacked.front(), 0);
    EXPECT_EQ(stacked.back(), 99999);
}

TEST(SpatialHashGrid, DistanceEqualToToleranceMatches)
{
    const std::vector<glm::vec3> points = {{0.f, 0.f, 0.f}, {0.5f, 0.f, 0.f}, {1.25f, 0.f, 0.f}};
    const geo::SpatialHashGrid   grid(points, 0.5);

    EXPECT_EQ(grid.neighborsOf(0), std::vector<int32_t>({1}));
    EXPECT_EQ(grid.neighborsOf(2), std::vector<int32_t>());
}

TEST(SpatialHashGrid, ChainIsReportedPairwise)
{
    // a-b and b-c within tolerance, a-c not.
    const std::vector<glm::vec3> points = {{0.f, 0.f, 0.f}, {0.8f, 0.f, 0.f}, {1.6f, 0.f, 0.f}};
    const geo::SpatialHashGrid   grid(points, 1.0);

    const std::vector<std::pair<int32_t, int32_t>> expected = {{0, 1}, {1, 2}};
    EXPECT_EQ(grid.overlappingPairs(), expected);
}

TEST(SpatialHashGrid, NegativeCoordinatesAcrossCellBorder)
{
    const std::vector<glm::vec3> points = {{-0.00005f, 0.f, 0.f}, {0.00004f, 0.f, 0.f}};
    const geo::SpatialHashGrid   grid(points, 0.0001);

    EXPECT_EQ(grid.overlappingPairs().size(), 1u);
}

TEST(SpatialHashGrid, ZeroToleranceMeansExactCoincidence)
{
    const std::vector<glm::vec3> points = {{1.f, 2.f, 3.f}, {1.f, 2.f, 3.f}, {1.f, 2.f, 3.0001f}};
    const geo::SpatialHashGrid   grid(points, 0.0);

    const std::vector<std::pair<int32_t, int32_t>> expected = {{0, 1}};
    EXPECT_EQ(grid.overlappingPairs(), expected);
    EXPECT_DOUBLE_EQ(grid.cellSize(), 1.0);
}

TEST(SpatialHashGrid, CandidatesIncludeNeighbors)
{
    const std::vector<glm::vec3> points = random_cloud(200, 1.f, 3u);
    const geo::SpatialHashGrid   grid(points, 0.1);

    for (int32_t i = 0; i < 50; ++i)
    {
        std::vector<int32_t> candidates = grid.queryCandidates(points[i]);
        std::sort(candidates.begin(), candidates.end());

        for (int32_t n : grid.queryNeighbors(points[i]))
            EXPECT_TRUE(std::binary_search(candidates.begin(), candidates.end(), n));
    }
}

TEST(SpatialHashGrid, HugeCoordinatesDoNotOverflow)
{
    const std::vector<glm::vec3> points = {{1e30f, 0.f, 0.f}, {1e30f, 0.f, 0.f}, {-1e30f, 0.f, 0.f}};
    const geo::SpatialHashGrid   grid(points, 1e-6);

    const std::vector<std::pair<int32_t, int32_t>> expected = {{0, 1}};
    EXPECT_EQ(grid.overlappingPairs(), expected);
}
