#include <gtest/gtest.h>

#include <glm/glm.hpp>

#include "ChkFlippedNormals.hpp"
#include "SysMesh.hpp"
#include "TestMeshes.hpp"

namespace
{
    PolygonResult run_check(const SysMesh& mesh)
    {
        const ChkFlippedNormals check;
        return std::get<PolygonResult>(check.runMesh("|cube", mesh, CheckSettings{}));
    }
} // namespace

TEST(FlippedNormals, ConsistentCubePasses)
{
    auto cube = tst::makeCube();
    EXPECT_TRUE(run_check(*cube).empty());
}

TEST(FlippedNormals, OneReversedFace)
{
    auto cube = tst::makeCube();
    cube->reverse_poly(3);

    const PolygonResult result = run_check(*cube);
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries.at("|cube"), PolygonResult::IndexSet({3}));
}

TEST(FlippedNormals, EveryFaceReversed)
{
    auto cube = tst::makeCube();
    for (int32_t poly = 0; poly < static_cast<int32_t>(cube->num_polys()); ++poly)
        cube->reverse_poly(poly);

    EXPECT_EQ(run_check(*cube).entries.at("|cube").size(), 6u);
}

TEST(FlippedNormals, InvariantUnderObjectTransform)
{
    // Same cube, moved and scaled far away from the origin.
    auto cube = tst::makeCube(glm::vec3(500.f, -120.f, 33.f), 7.5f);
    cube->reverse_poly(1);

    EXPECT_EQ(run_check(*cube).entries.at("|cube"), PolygonResult::IndexSet({1}));
}

TEST(FlippedNormals, DegenerateFaceIsNotFlagged)
{
    auto cube = tst::makeCube();
    const int32_t a = cube->create_vert(glm::vec3(0.5f, 0.f, 0.f));
    const int32_t b = cube->create_vert(glm::vec3(0.5f, 0.1f, 0.f));
    cube->create_poly({a, b, a});

    EXPECT_TRUE(run_check(*cube).empty());
}

TEST(FlippedNormals, FaceAcrossTheCenterIsNotFlagged)
{
    // Interior faces whose normal is perpendicular to the direction from the
    // center: the first one sits on the center, the second one beside it.
    for (const bool reversed : {false, true})
    {
        auto cube = tst::makeCube();

        const int32_t a = cube->create_vert(glm::vec3(-0.25f, 0.f, -0.25f));
        const int32_t b = cube->create_vert(glm::vec3(0.25f, 0.f, -0.25f));
        const int32_t c = cube->create_vert(glm::vec3(0.25f, 0.f, 0.25f));
        const int32_t d = cube->create_vert(glm::vec3(-0.25f, 0.f, 0.25f));
        const int32_t through = cube->create_poly({a, b, c, d});

        const int32_t e = cube->create_vert(glm::vec3(0.1f, -0.2f, 0.f));
        const int32_t f = cube->create_vert(glm::vec3(0.5f, -0.2f, 0.f));
        const int32_t g = cube->create_vert(glm::vec3(0.5f, 0.2f, 0.f));
        const int32_t h = cube->create_vert(glm::vec3(0.1f, 0.2f, 0.f));
        const int32_t beside = cube->create_poly({e, f, g, h});

        if (reversed)
        {
            cube->reverse_poly(through);
            cube->reverse_poly(beside);
        }

        EXPECT_TRUE(run_check(*cube).empty()) << "reversed " << reversed;
    }
}

TEST(FlippedNormals, ReportsCheckKind)
{
    const ChkFlippedNormals check;
    EXPECT_EQ(check.kind(), ResultKind::Polygon);
    EXPECT_EQ(check.target(), CheckTarget::Mesh);
}
