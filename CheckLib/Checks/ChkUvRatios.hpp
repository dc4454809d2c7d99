#pragma once

#include "Check.hpp"

/**
 * @class ChkUvDistortion
 * @brief Flags faces whose UV area is out of proportion with their 3D area.
 *
 * The ratio UV area / 3D area of every mapped face is divided by the median ratio
 * of the mesh. Faces outside [uvDistortionMin, uvDistortionMax] are flagged.
 * Unmapped faces and faces without 3D area take no part.
 */
class ChkUvDistortion final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId&     id,
                  const SysMesh&       mesh,
                  const CheckSettings& settings,
                  PolygonResult&       result) const override;
};

/**
 * @class ChkTexelDensity
 * @brief Same as ChkUvDistortion with the ratio expressed in texels
 * (UV area * textureSize^2 / 3D area) and the texelDensity thresholds.
 */
class ChkTexelDensity final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId&     id,
                  const SysMesh&       mesh,
                  const CheckSettings& settings,
                  PolygonResult&       result) const override;
};
