#include "ChkUvRatios.hpp"

#include <cmath>
#include <vector>

#include "PolygonArea.hpp"
#include "RatioStats.hpp"
#include "SysMesh.hpp"

namespace
{
    std::vector<geo::FaceRatio> uv_area_ratios(const SysMesh& mesh, double scale)
    {
        std::vector<geo::FaceRatio> ratios;

        const int32_t map = mesh.map_find(kSysUvMapId);
        if (map < 0 || mesh.map_dim(map) < 2)
            return ratios;

        ratios.reserve(mesh.num_polys());
        for (int32_t poly = 0; poly < static_cast<int32_t>(mesh.num_polys()); ++poly)
        {
            if (!mesh.map_poly_valid(map, poly))
                continue;

            const double area = geo::polyArea(mesh, poly);
            if (!(area > 0.0) || !std::isfinite(area))
                continue;

            ratios.push_back({poly, geo::polyUvArea(mesh, map, poly) * scale / area});
        }

        return ratios;
    }

    void flag_outliers(const SysMeshId&                   id,
                       const std::vector<geo::FaceRatio>& ratios,
                       double                             min,
                       double                             max,
                       PolygonResult&                     result)
    {
        if (!geo::normalizable(ratios))
            return;

        PolygonResult::IndexSet flagged;
        for (const geo::FaceRatio& r : geo::normalize(ratios))
        {
            if (r.ratio < min || r.ratio > max)
                flagged.insert(r.face);
        }

        result.flag(id, std::move(flagged));
    }
} // namespace

void ChkUvDistortion::evaluate(const SysMeshId&     id,
                               const SysMesh&       mesh,
                               const CheckSettings& settings,
                               PolygonResult&       result) const
{
    flag_outliers(id, uv_area_ratios(mesh, 1.0), settings.uvDistortionMin, settings.uvDistortionMax, result);
}

void ChkTexelDensity::evaluate(const SysMeshId&     id,
                               const SysMesh&       mesh,
                               const CheckSettings& settings,
                               PolygonResult&       result) const
{
    const double size = static_cast<double>(settings.textureSize);

    flag_outliers(id, uv_area_ratios(mesh, size * size), settings.texelDensityMin, settings.texelDensityMax, result);
}
