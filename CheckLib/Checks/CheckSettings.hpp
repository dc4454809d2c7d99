#pragma once

#include <cstdint>
#include <string>

/**
 * @brief Thresholds and options for every built-in check.
 *
 * Passed explicitly to each check; there is no global check state. Defaults
 * match the reference values artists are used to.
 */
struct CheckSettings
{
    /// overlappingVertices: max distance between two vertices considered the same.
    double overlapTolerance = 0.0001;

    /// overlappingVertices: multiply overlapTolerance by the mesh bounding-box diagonal.
    bool overlapScaleRelative = false;

    /// uvDistortion: accepted range of the normalized UV/3D area ratio.
    double uvDistortionMin = 0.5;
    double uvDistortionMax = 2.0;

    /// texelDensity: accepted range of the normalized texel density.
    double texelDensityMin = 0.5;
    double texelDensityMax = 2.0;

    /// texelDensity: texture edge length in pixels.
    int32_t textureSize = 1024;

    /// polyCountLimit: meshes with more faces than this are flagged.
    int64_t polyCountLimit = 10000;

    /// sceneUnits: expected linear unit of the scene.
    std::string expectedUnit = "cm";

    /// zeroAreaFaces: faces with area <= this are flagged.
    double zeroAreaTolerance = 1e-5;

    /// zeroLengthEdges: edges with length <= this are flagged.
    double zeroLengthTolerance = 1e-8;

    /// poles: vertices with more connected edges than this are flagged.
    int32_t poleEdgeLimit = 5;

    /// uvRange: largest accepted u coordinate (UDIM rows of 10 tiles).
    double uvRangeMaxU = 10.0;

    /// onBorder: max distance of a UV coordinate to a tile border.
    double onBorderTolerance = 1e-5;

    /// Worker threads for a run. 0 = hardware concurrency, 1 = run on the calling thread.
    int32_t threadCount = 0;
};
