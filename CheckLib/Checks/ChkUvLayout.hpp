#pragma once

#include "Check.hpp"

/**
 * @class ChkMissingUvs
 * @brief Flags faces without texture coordinates. A mesh without a UV map flags every face.
 */
class ChkMissingUvs final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};

/**
 * @class ChkUvRange
 * @brief Flags UVs outside the UDIM range: u < 0, u > CheckSettings::uvRangeMaxU or v < 0.
 */
class ChkUvRange final : public MeshCheck<UvResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, UvResult& result) const override;
};

/**
 * @class ChkOnBorder
 * @brief Flags UVs lying on a tile border (within CheckSettings::onBorderTolerance
 * of an integer in u or v).
 */
class ChkOnBorder final : public MeshCheck<UvResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, UvResult& result) const override;
};

/**
 * @class ChkCrossBorder
 * @brief Flags faces whose UVs spread over more than one unit tile in u or v.
 *
 * A face touching a tile border from inside (e.g. u in [0, 1]) stays in one tile.
 */
class ChkCrossBorder final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};
