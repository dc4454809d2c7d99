#pragma once

#include "Check.hpp"

/**
 * @class ChkPolyCountLimit
 * @brief Flags meshes with more than CheckSettings::polyCountLimit faces.
 */
class ChkPolyCountLimit final : public MeshCheck<NodeResult>
{
protected:
    void evaluate(const SysMeshId&     id,
                  const SysMesh&       mesh,
                  const CheckSettings& settings,
                  NodeResult&          result) const override;
};

/**
 * @class ChkSceneUnits
 * @brief Flags the scene when its linear unit is not CheckSettings::expectedUnit.
 */
class ChkSceneUnits final : public SceneCheck<SceneFlagResult>
{
protected:
    void evaluate(const SysMeshScene& scene, const CheckSettings& settings, SceneFlagResult& result) const override;
};
