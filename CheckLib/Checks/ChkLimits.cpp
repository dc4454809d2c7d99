#include "ChkLimits.hpp"

#include "SysMesh.hpp"
#include "SysMeshScene.hpp"

void ChkPolyCountLimit::evaluate(const SysMeshId&     id,
                                 const SysMesh&       mesh,
                                 const CheckSettings& settings,
                                 NodeResult&          result) const
{
    if (static_cast<int64_t>(mesh.num_polys()) > settings.polyCountLimit)
        result.flag(id);
}

void ChkSceneUnits::evaluate(const SysMeshScene& scene, const CheckSettings& settings, SceneFlagResult& result) const
{
    const std::string unit = scene.linearUnit();

    if (unit != settings.expectedUnit)
    {
        result.flagged = true;
        result.message = "Scene unit is '" + unit + "', expected '" + settings.expectedUnit + "'";
    }
}
