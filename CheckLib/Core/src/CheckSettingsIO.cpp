#include "CheckSettingsIO.hpp"

#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <string>
#include <unordered_map>

using json = nlohmann::json;

namespace
{
    using Apply = std::function<bool(const json&, CheckSettings&)>;

    Apply number(double CheckSettings::* member, double min = -std::numeric_limits<double>::infinity())
    {
        return [member, min](const json& v, CheckSettings& s) {
            if (!v.is_number() || v.get<double>() < min)
                return false;
            s.*member = v.get<double>();
            return true;
        };
    }

    template<typename Int>
    Apply integer(Int CheckSettings::* member, int64_t min)
    {
        return [member, min](const json& v, CheckSettings& s) {
            if (!v.is_number_integer() || v.get<int64_t>() < min ||
                v.get<int64_t>() > static_cast<int64_t>(std::numeric_limits<Int>::max()))
                return false;
            s.*member = static_cast<Int>(v.get<int64_t>());
            return true;
        };
    }

    Apply boolean(bool CheckSettings::* member)
    {
        return [member](const json& v, CheckSettings& s) {
            if (!v.is_boolean())
                return false;
            s.*member = v.get<bool>();
            return true;
        };
    }

    Apply text(std::string CheckSettings::* member)
    {
        return [member](const json& v, CheckSettings& s) {
            if (!v.is_string())
                return false;
            s.*member = v.get<std::string>();
            return true;
        };
    }

    const std::unordered_map<std::string, Apply>& setters()
    {
        static const std::unordered_map<std::string, Apply> table = {
            {"overlapTolerance", number(&CheckSettings::overlapTolerance)},
            {"overlapScaleRelative", boolean(&CheckSettings::overlapScaleRelative)},
            {"uvDistortionMin", number(&CheckSettings::uvDistortionMin)},
            {"uvDistortionMax", number(&CheckSettings::uvDistortionMax)},
            {"texelDensityMin", number(&CheckSettings::texelDensityMin)},
            {"texelDensityMax", number(&CheckSettings::texelDensityMax)},
            {"textureSize", integer(&CheckSettings::textureSize, 1)},
            {"polyCountLimit", integer(&CheckSettings::polyCountLimit, 0)},
            {"expectedUnit", text(&CheckSettings::expectedUnit)},
            {"zeroAreaTolerance", number(&CheckSettings::zeroAreaTolerance)},
            {"zeroLengthTolerance", number(&CheckSettings::zeroLengthTolerance)},
            {"poleEdgeLimit", integer(&CheckSettings::poleEdgeLimit, 0)},
            {"uvRangeMaxU", number(&CheckSettings::uvRangeMaxU)},
            {"onBorderTolerance", number(&CheckSettings::onBorderTolerance, 0.0)},
            {"threadCount", integer(&CheckSettings::threadCount, 0)},
        };
        return table;
    }

    // An inverted min/max pair is an error; both ends go back to their previous values.
    void check_range(const std::string& name, double& lo, double& hi, double prevLo, double prevHi, SettingsLoadReport& report)
    {
        if (lo <= hi)
            return;

        report.errors.push_back(name + "Min (" + std::to_string(lo) + ") is greater than " + name + "Max (" +
                                std::to_string(hi) + ")");
        lo = prevLo;
        hi = prevHi;
    }
} // namespace

bool applyCheckSettings(const json& config, CheckSettings& settings, SettingsLoadReport& report)
{
    if (!config.is_object())
    {
        report.errors.push_back("Settings must be a JSON object");
        return false;
    }

    const size_t        errorsBefore = report.errors.size();
    const CheckSettings previous     = settings;

    for (const auto& [key, value] : config.items())
    {
        auto it = setters().find(key);
        if (it == setters().end())
        {
            report.warnings.push_back("Unknown setting '" + key + "' ignored");
            continue;
        }

        if (!it->second(value, settings))
            report.errors.push_back("Invalid value for setting '" + key + "': " + value.dump());
    }

    check_range("uvDistortion", settings.uvDistortionMin, settings.uvDistortionMax,
                previous.uvDistortionMin, previous.uvDistortionMax, report);
    check_range("texelDensity", settings.texelDensityMin, settings.texelDensityMax,
                previous.texelDensityMin, previous.texelDensityMax, report);

    return report.errors.size() == errorsBefore;
}

bool loadCheckSettings(const std::string& path, CheckSettings& settings, SettingsLoadReport& report)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open settings file " << path << "\n";
        report.errors.push_back("Could not open settings file " + path);
        return false;
    }

    json config;
    try
    {
        file >> config;
    }
    catch (const json::parse_error& e)
    {
        report.errors.push_back("Failed to parse " + path + ": " + e.what());
        return false;
    }

    return applyCheckSettings(config, settings, report);
}

json checkSettingsToJson(const CheckSettings& s)
{
    return json{
        {"overlapTolerance", s.overlapTolerance},
        {"overlapScaleRelative", s.overlapScaleRelative},
        {"uvDistortionMin", s.uvDistortionMin},
        {"uvDistortionMax", s.uvDistortionMax},
        {"texelDensityMin", s.texelDensityMin},
        {"texelDensityMax", s.texelDensityMax},
        {"textureSize", s.textureSize},
        {"polyCountLimit", s.polyCountLimit},
        {"expectedUnit", s.expectedUnit},
        {"zeroAreaTolerance", s.zeroAreaTolerance},
        {"zeroLengthTolerance", s.zeroLengthTolerance},
        {"poleEdgeLimit", s.poleEdgeLimit},
        {"uvRangeMaxU", s.uvRangeMaxU},
        {"onBorderTolerance", s.onBorderTolerance},
        {"threadCount", s.threadCount},
    };
}
