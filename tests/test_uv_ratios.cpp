#include <gtest/gtest.h>

#include <glm/glm.hpp>

#include "ChkUvRatios.hpp"
#include "SysMesh.hpp"
#include "TestMeshes.hpp"

namespace
{
    template<typename CheckT>
    PolygonResult run_check(const SysMesh& mesh, const CheckSettings& settings = {})
    {
        const CheckT check;
        return std::get<PolygonResult>(check.runMesh("|grid", mesh, settings));
    }

    // 3x3 grid with a uniform layout except for the center face, which gets four
    // times the UV area of its neighbours.
    std::shared_ptr<SysMesh> grid_with_stretched_center()
    {
        auto grid = tst::makeGrid(3, 3);
        tst::addPlanarUvs(*grid, 0.1f);
        tst::setPolyUvs(*grid, 4, {{0.2f, 0.2f}, {0.4f, 0.2f}, {0.4f, 0.4f}, {0.2f, 0.4f}});
        return grid;
    }
} // namespace

TEST(UvDistortion, UniformLayoutPasses)
{
    auto grid = tst::makeGrid(3, 3);
    tst::addPlanarUvs(*grid, 0.1f);

    EXPECT_TRUE(run_check<ChkUvDistortion>(*grid).empty());
}

TEST(UvDistortion, FlagsOnlyTheStretchedFace)
{
    auto grid = grid_with_stretched_center();

    const PolygonResult result = run_check<ChkUvDistortion>(*grid);
    EXPECT_EQ(result.entries.at("|grid"), PolygonResult::IndexSet({4}));
}

TEST(UvDistortion, BoundsAreSettings)
{
    auto grid = grid_with_stretched_center();

    CheckSettings settings;
    settings.uvDistortionMax = 5.0;
    EXPECT_TRUE(run_check<ChkUvDistortion>(*grid, settings).empty());

    // Every regular face is now "too small".
    settings.uvDistortionMin = 1.5;
    EXPECT_EQ(run_check<ChkUvDistortion>(*grid, settings).entries.at("|grid").size(), 8u);
}

TEST(UvDistortion, NoUvMapPasses)
{
    auto grid = tst::makeGrid(3, 3);
    EXPECT_TRUE(run_check<ChkUvDistortion>(*grid).empty());
}

TEST(UvDistortion, SingleMappedFaceCannotBeCompared)
{
    auto grid = tst::makeGrid(3, 3);
    tst::setPolyUvs(*grid, 0, {{0.f, 0.f}, {5.f, 0.f}, {5.f, 5.f}, {0.f, 5.f}});

    EXPECT_TRUE(run_check<ChkUvDistortion>(*grid).empty());
}

TEST(UvDistortion, ZeroAreaFacesAreSkipped)
{
    auto grid = tst::makeGrid(3, 3);
    tst::addPlanarUvs(*grid, 0.1f);

    // Collapse the UVs of face 0 and the geometry of a new face.
    tst::setPolyUvs(*grid, 0, {{0.f, 0.f}, {0.f, 0.f}, {0.f, 0.f}, {0.f, 0.f}});

    const int32_t flat = grid->create_poly({0, 1, 1, 0});
    ASSERT_GE(flat, 0);

    const PolygonResult result = run_check<ChkUvDistortion>(*grid);
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries.at("|grid"), PolygonResult::IndexSet({0}));
}

TEST(TexelDensity, FlagsOnlyTheStretchedFace)
{
    auto grid = grid_with_stretched_center();

    EXPECT_EQ(run_check<ChkTexelDensity>(*grid).entries.at("|grid"), PolygonResult::IndexSet({4}));
}

TEST(TexelDensity, TextureSizeDoesNotChangeOutliers)
{
    auto grid = grid_with_stretched_center();

    CheckSettings settings;
    settings.textureSize = 4096;
    EXPECT_EQ(run_check<ChkTexelDensity>(*grid, settings).entries.at("|grid"), PolygonResult::IndexSet({4}));
}
