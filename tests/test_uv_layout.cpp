#include <gtest/gtest.h>

#include "ChkUvLayout.hpp"
#include "SysMesh.hpp"
#include "TestMeshes.hpp"

namespace
{
    template<typename CheckT, typename Result>
    typename Result::IndexSet flagged(const SysMesh& mesh, const CheckSettings& settings = {})
    {
        const CheckT check;
        const Result result = std::get<Result>(check.runMesh("|m", mesh, settings));
        return result.empty() ? typename Result::IndexSet{} : result.entries.at("|m");
    }
} // namespace

TEST(UvLayout, MissingUvs)
{
    auto cube = tst::makeCube();
    EXPECT_EQ((flagged<ChkMissingUvs, PolygonResult>(*cube)).size(), 6u);

    tst::setPolyUvs(*cube, 0, {{0, 0}, {1, 0}, {1, 1}, {0, 1}});
    EXPECT_EQ((flagged<ChkMissingUvs, PolygonResult>(*cube)), PolygonResult::IndexSet({1, 2, 3, 4, 5}));

    tst::addPlanarUvs(*cube);
    EXPECT_TRUE((flagged<ChkMissingUvs, PolygonResult>(*cube)).empty());
}

TEST(UvLayout, UvRange)
{
    auto grid = tst::makeGrid(1, 1);
    tst::addPlanarUvs(*grid);
    EXPECT_TRUE((flagged<ChkUvRange, UvResult>(*grid)).empty());

    // Map verts 4..7 replace the planar ones; 0..3 are no longer referenced.
    tst::setPolyUvs(*grid, 0, {{-0.5f, 0.f}, {0.5f, 0.f}, {11.f, 1.f}, {0.5f, -1.f}});
    EXPECT_EQ((flagged<ChkUvRange, UvResult>(*grid)), UvResult::IndexSet({4, 6, 7}));

    CheckSettings settings;
    settings.uvRangeMaxU = 20.0;
    EXPECT_EQ((flagged<ChkUvRange, UvResult>(*grid, settings)), UvResult::IndexSet({4, 7}));
}

TEST(UvLayout, NoMapNoUvFlags)
{
    auto cube = tst::makeCube();
    EXPECT_TRUE((flagged<ChkUvRange, UvResult>(*cube)).empty());
    EXPECT_TRUE((flagged<ChkOnBorder, UvResult>(*cube)).empty());
    EXPECT_TRUE((flagged<ChkCrossBorder, PolygonResult>(*cube)).empty());
}

TEST(UvLayout, OnBorder)
{
    auto grid = tst::makeGrid(1, 1);
    tst::addPlanarUvs(*grid);
    EXPECT_EQ((flagged<ChkOnBorder, UvResult>(*grid)), UvResult::IndexSet({0, 1, 2, 3}));

    auto inner = tst::makeGrid(1, 1);
    tst::setPolyUvs(*inner, 0, {{0.25f, 0.25f}, {0.75f, 0.25f}, {0.75f, 2.000001f}, {0.25f, 0.75f}});
    EXPECT_EQ((flagged<ChkOnBorder, UvResult>(*inner)), UvResult::IndexSet({2}));
}

TEST(UvLayout, OnBorderFromBelow)
{
    auto grid = tst::makeGrid(1, 1);
    tst::setPolyUvs(*grid, 0, {{0.5f, 0.999995f}, {0.5f, 0.4f}, {-0.999995f, 0.5f}, {0.99998f, 0.5f}});

    EXPECT_EQ((flagged<ChkOnBorder, UvResult>(*grid)), UvResult::IndexSet({0, 2}));
}

TEST(UvLayout, CrossBorder)
{
    auto grid = tst::makeGrid(3, 1);
    tst::setPolyUvs(*grid, 0, {{0.5f, 0.5f}, {1.5f, 0.5f}, {1.5f, 0.8f}, {0.5f, 0.8f}}); // crosses u = 1
    tst::setPolyUvs(*grid, 1, {{0.f, 0.f}, {1.f, 0.f}, {1.f, 1.f}, {0.f, 1.f}});         // touches the border
    tst::setPolyUvs(*grid, 2, {{1.2f, 2.2f}, {1.8f, 2.2f}, {1.8f, 2.8f}, {1.2f, 2.8f}}); // inside tile (1, 2)

    EXPECT_EQ((flagged<ChkCrossBorder, PolygonResult>(*grid)), PolygonResult::IndexSet({0}));
}
