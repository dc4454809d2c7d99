#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "CheckSettings.hpp"

/// Messages produced while reading settings.
struct SettingsLoadReport
{
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const noexcept
    {
        return errors.empty();
    }
};

/**
 * @brief Overlay the values of a JSON object on @p settings.
 *
 * Keys use the CheckSettings member names. Unknown keys are reported as
 * warnings. A value of the wrong type (or out of range) is reported as an
 * error and that setting keeps its previous value; the other keys still apply.
 * A min/max pair that ends up inverted (uvDistortion, texelDensity) is an
 * error too, and both ends keep their previous values.
 *
 * @return True if no errors were reported.
 */
bool applyCheckSettings(const nlohmann::json& json, CheckSettings& settings, SettingsLoadReport& report);

/**
 * @brief Read a JSON settings file and apply it with applyCheckSettings().
 * @return False if the file cannot be read or parsed, or if applying it reported errors.
 */
bool loadCheckSettings(const std::string& path, CheckSettings& settings, SettingsLoadReport& report);

/// @return All settings as a JSON object (the format loadCheckSettings() reads).
[[nodiscard]] nlohmann::json checkSettingsToJson(const CheckSettings& settings);
