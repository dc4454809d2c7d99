#include "RatioStats.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace geo
{

    double median(std::vector<double> values)
    {
        if (values.empty())
            return 0.0;

        const size_t mid = values.size() / 2;
        std::nth_element(values.begin(), values.begin() + mid, values.end());
        const double upper = values[mid];

        if (values.size() % 2 != 0)
            return upper;

        // After nth_element everything left of mid is <= upper.
        const double lower = *std::max_element(values.begin(), values.begin() + mid);
        return 0.5 * (lower + upper);
    }

    double median(const std::vector<FaceRatio>& ratios)
    {
        std::vector<double> values;
        values.reserve(ratios.size());
        for (const FaceRatio& r : ratios)
            values.push_back(r.ratio);

        return median(std::move(values));
    }

    bool normalizable(const std::vector<FaceRatio>& ratios)
    {
        if (ratios.size() < 2)
            return false;

        const double m = median(ratios);
        return std::isfinite(m) && m > 0.0;
    }

    std::vector<FaceRatio> normalize(std::vector<FaceRatio> ratios)
    {
        if (!normalizable(ratios))
            return ratios;

        const double m = median(ratios);
        for (FaceRatio& r : ratios)
            r.ratio /= m;

        return ratios;
    }

} // namespace geo
