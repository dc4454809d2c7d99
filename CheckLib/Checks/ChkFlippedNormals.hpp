#pragma once

#include "Check.hpp"

/**
 * @brief Flags faces whose normal points towards the middle of the mesh.
 *
 * Uses the object-space bounding-box center as "inside": a face is flagged when
 * dot(face normal, face center - box center) < 0. Concave meshes produce known
 * false positives; faces with a zero normal or exactly perpendicular to the
 * outward direction are never flagged.
 */
class ChkFlippedNormals final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId&     id,
                  const SysMesh&       mesh,
                  const CheckSettings& settings,
                  PolygonResult&       result) const override;
};
