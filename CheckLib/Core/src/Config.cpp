#include "Config.hpp"

#include "CheckRegistry.hpp"
#include "ChkFlippedNormals.hpp"
#include "ChkLimits.hpp"
#include "ChkOverlappingVertices.hpp"
#include "ChkTopology.hpp"
#include "ChkUvLayout.hpp"
#include "ChkUvRatios.hpp"

namespace config
{

    void registerChecks(CheckRegistry& registry)
    {
        using RK = ResultKind;

        registry.registerCheck({"polyCountLimit", "Poly Count Limit", "general", RK::Nodes}, &CheckRegistry::createCheckType<ChkPolyCountLimit>);

        registry.registerCheck({"triangles", "Triangles", "topology", RK::Polygon}, &CheckRegistry::createCheckType<ChkTriangles>);
        registry.registerCheck({"ngons", "Ngons", "topology", RK::Polygon}, &CheckRegistry::createCheckType<ChkNgons>);
        registry.registerCheck({"openEdges", "Open Edges", "topology", RK::Edge}, &CheckRegistry::createCheckType<ChkOpenEdges>);
        registry.registerCheck({"poles", "Poles", "topology", RK::Vertex}, &CheckRegistry::createCheckType<ChkPoles>);
        registry.registerCheck({"lamina", "Lamina", "topology", RK::Polygon}, &CheckRegistry::createCheckType<ChkLamina>);
        registry.registerCheck({"zeroAreaFaces", "Zero Area Faces", "topology", RK::Polygon}, &CheckRegistry::createCheckType<ChkZeroAreaFaces>);
        registry.registerCheck({"zeroLengthEdges", "Zero Length Edges", "topology", RK::Edge}, &CheckRegistry::createCheckType<ChkZeroLengthEdges>);
        registry.registerCheck({"nonManifoldEdges", "Non Manifold Edges", "topology", RK::Edge}, &CheckRegistry::createCheckType<ChkNonManifoldEdges>);
        registry.registerCheck({"flippedNormals", "Flipped Normals", "topology", RK::Polygon}, &CheckRegistry::createCheckType<ChkFlippedNormals>);
        registry.registerCheck({"overlappingVertices", "Overlapping Vertices", "topology", RK::Vertex}, &CheckRegistry::createCheckType<ChkOverlappingVertices>);
        registry.registerCheck({"concaveFaces", "Concave Faces", "topology", RK::Polygon}, &CheckRegistry::createCheckType<ChkConcaveFaces>);
        registry.registerCheck({"hardEdges", "Hard Edges", "topology", RK::Edge}, &CheckRegistry::createCheckType<ChkHardEdges>);
        registry.registerCheck({"starlike", "Starlike", "topology", RK::Polygon}, &CheckRegistry::createCheckType<ChkStarlike>);

        registry.registerCheck({"missingUVs", "Missing UVs", "UVs", RK::Polygon}, &CheckRegistry::createCheckType<ChkMissingUvs>);
        registry.registerCheck({"uvRange", "UV Range", "UVs", RK::Uv}, &CheckRegistry::createCheckType<ChkUvRange>);
        registry.registerCheck({"crossBorder", "Cross Border", "UVs", RK::Polygon}, &CheckRegistry::createCheckType<ChkCrossBorder>);
        registry.registerCheck({"onBorder", "On Border", "UVs", RK::Uv}, &CheckRegistry::createCheckType<ChkOnBorder>);
        registry.registerCheck({"uvDistortion", "UV Distortion", "UVs", RK::Polygon}, &CheckRegistry::createCheckType<ChkUvDistortion>);
        registry.registerCheck({"texelDensity", "Texel Density", "UVs", RK::Polygon}, &CheckRegistry::createCheckType<ChkTexelDensity>);

        registry.registerCheck({"sceneUnits", "Scene Units", "scene", RK::SceneFlag}, &CheckRegistry::createCheckType<ChkSceneUnits>);
    }

} // namespace config
