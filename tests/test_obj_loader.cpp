#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <glm/glm.hpp>
#include <sstream>

#include "MeshScene.hpp"
#include "SysMesh.hpp"
#include "SysObjLoader.hpp"

namespace
{
    const char* kTwoObjects = R"(# two objects
v 0 0 0
v 1 0 0
v 1 1 0
v 0 1 0
v 0 0 1
vt 0 0
vt 1 0
vt 1 1
vt 0 1
vn 0 0 1
o plane
usemtl red
f 1/1/1 2/2/1 3/3/1 4/4/1
o tri
f 1 2 5
f -5 -4 -1
)";
} // namespace

TEST(ObjLoader, ObjectsAndMaps)
{
    std::istringstream     in(kTwoObjects);
    std::vector<ObjObject> objects;
    ObjMaterials           materials;
    ObjLoadReport          report;

    ASSERT_TRUE(loadObjStream(in, "", objects, materials, report));
    EXPECT_TRUE(report.warnings.empty());
    ASSERT_EQ(objects.size(), 2u);

    const ObjObject& plane = objects[0];
    EXPECT_EQ(plane.name, "plane");
    EXPECT_EQ(plane.material, "red");
    EXPECT_EQ(plane.mesh->num_verts(), 4u);
    EXPECT_EQ(plane.mesh->num_polys(), 1u);

    const int32_t uvMap = plane.mesh->map_find(kSysUvMapId);
    ASSERT_GE(uvMap, 0);
    EXPECT_TRUE(plane.mesh->map_poly_valid(uvMap, 0));
    EXPECT_GE(plane.mesh->map_find(kSysNormalMapId), 0);

    // Vertices are compacted per object; negative indices are relative.
    const ObjObject& tri = objects[1];
    EXPECT_EQ(tri.name, "tri");
    EXPECT_EQ(tri.mesh->num_verts(), 3u);
    EXPECT_EQ(tri.mesh->num_polys(), 2u);
    EXPECT_LT(tri.mesh->map_find(kSysUvMapId), 0);
    EXPECT_EQ(tri.material, "red"); // usemtl carries over to the next object
}

TEST(ObjLoader, BadFacesAreSkipped)
{
    std::istringstream in("v 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 2 3\nf 1 2 9\nf 1 2\n");

    std::vector<ObjObject> objects;
    ObjMaterials           materials;
    ObjLoadReport          report;

    ASSERT_TRUE(loadObjStream(in, "", objects, materials, report));
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].name, "default");
    EXPECT_EQ(objects[0].mesh->num_polys(), 1u);
    ASSERT_EQ(report.warnings.size(), 2u);
    EXPECT_NE(report.warnings[0].find("line 5"), std::string::npos);
}

TEST(ObjLoader, UnusedPointsAreKept)
{
    // A stray duplicate of the first corner inside "quad", one point before any
    // object and a point cloud object without faces.
    std::istringstream in("v 5 5 5\n"
                          "o quad\n"
                          "v 0 0 0\nv 1 0 0\nv 1 1 0\nv 0 1 0\nv 0 0 0\n"
                          "f 2 3 4 5\n"
                          "o cloud\n"
                          "v 9 9 9\nv 8 8 8\n");

    std::vector<ObjObject> objects;
    ObjMaterials           materials;
    ObjLoadReport          report;

    ASSERT_TRUE(loadObjStream(in, "", objects, materials, report));
    ASSERT_EQ(objects.size(), 2u);

    const SysMesh& quad = *objects[0].mesh;
    EXPECT_EQ(objects[0].name, "quad");
    ASSERT_EQ(quad.num_verts(), 6u);
    EXPECT_EQ(quad.num_polys(), 1u);
    EXPECT_EQ(quad.vert_position(4), glm::vec3(5.f));
    EXPECT_EQ(quad.vert_position(5), glm::vec3(0.f));

    EXPECT_EQ(objects[1].name, "cloud");
    EXPECT_EQ(objects[1].mesh->num_verts(), 2u);
    EXPECT_EQ(objects[1].mesh->num_polys(), 0u);
}

TEST(ObjLoader, PartialUvsAreIgnored)
{
    std::istringstream in("v 0 0 0\nv 1 0 0\nv 0 1 0\nvt 0 0\nf 1/1 2 3\n");

    std::vector<ObjObject> objects;
    ObjMaterials           materials;
    ObjLoadReport          report;

    ASSERT_TRUE(loadObjStream(in, "", objects, materials, report));
    EXPECT_LT(objects[0].mesh->map_find(kSysUvMapId), 0);
}

TEST(ObjLoader, MissingFile)
{
    std::vector<ObjObject> objects;
    ObjMaterials           materials;
    ObjLoadReport          report;

    EXPECT_FALSE(loadObjObjects("/nonexistent/meshcheck/model.obj", objects, materials, report));
    EXPECT_EQ(report.status, ObjLoadStatus::FileNotFound);
}

TEST(ObjLoader, SceneImportWithMaterials)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "meshcheck_obj_test";
    std::filesystem::create_directories(dir);

    std::ofstream(dir / "props.mtl") << "newmtl red\nKd 1 0 0\nmap_Kd red.png\n";
    std::ofstream(dir / "props.obj") << "mtllib props.mtl\n" << kTwoObjects;

    MeshScene     scene;
    ObjLoadReport report;

    const std::vector<SysMeshId> ids = scene.loadObj((dir / "props.obj").string(), report);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(ids, (std::vector<SysMeshId>{"|props|plane", "|props|tri"}));
    EXPECT_EQ(scene.meshCount(), 2u);
    EXPECT_EQ(scene.shadingAssignment("|props|plane"), "red");

    ASSERT_EQ(scene.materials().size(), 1u);
    EXPECT_FLOAT_EQ(scene.materials()[0].Kd.r, 1.f);
    EXPECT_EQ(std::filesystem::path(scene.materials()[0].map_Kd).filename().string(), "red.png");

    EXPECT_EQ(scene.hierarchyMeshIds("|props"), ids);

    std::filesystem::remove_all(dir);
}
