#pragma once

#include "Check.hpp"

/**
 * @brief Flags vertices that lie within CheckSettings::overlapTolerance of another vertex.
 *
 * Every vertex of every close pair is reported; pairs are not grouped into
 * clusters. With CheckSettings::overlapScaleRelative the tolerance is a fraction
 * of the bounding-box diagonal.
 */
class ChkOverlappingVertices final : public MeshCheck<VertexResult>
{
protected:
    void evaluate(const SysMeshId&     id,
                  const SysMesh&       mesh,
                  const CheckSettings& settings,
                  VertexResult&        result) const override;
};
