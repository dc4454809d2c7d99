#pragma once

#include <cstdint>
#include <vector>

namespace geo
{

    /// Per-face ratio (UV area over 3D area, optionally scaled).
    struct FaceRatio
    {
        int32_t face  = -1;
        double  ratio = 0.0;
    };

    /**
     * @brief Median of @p values.
     *
     * The middle value for an odd count, the mean of the two middle values for an
     * even count. 0 for an empty set.
     */
    [[nodiscard]] double median(std::vector<double> values);

    /// @return The median of the ratio members of @p ratios.
    [[nodiscard]] double median(const std::vector<FaceRatio>& ratios);

    /**
     * @brief Divides every ratio by the median of the set.
     *
     * Sets with fewer than 2 entries and sets whose median is not strictly
     * positive are returned unchanged.
     */
    [[nodiscard]] std::vector<FaceRatio> normalize(std::vector<FaceRatio> ratios);

    /// @return True if normalize() would rescale @p ratios.
    [[nodiscard]] bool normalizable(const std::vector<FaceRatio>& ratios);

} // namespace geo
