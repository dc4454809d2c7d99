#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "CheckSettingsIO.hpp"

using json = nlohmann::json;

namespace
{
    std::filesystem::path write_temp(const std::string& name, const std::string& text)
    {
        const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream(path) << text;
        return path;
    }
} // namespace

TEST(SettingsIO, AppliesKnownKeys)
{
    CheckSettings      settings;
    SettingsLoadReport report;

    const json config = {
        {"overlapTolerance", 0.01},
        {"overlapScaleRelative", true},
        {"textureSize", 2048},
        {"polyCountLimit", 500},
        {"expectedUnit", "m"},
        {"poleEdgeLimit", 6},
        {"threadCount", 2},
    };

    EXPECT_TRUE(applyCheckSettings(config, settings, report));
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.warnings.empty());

    EXPECT_DOUBLE_EQ(settings.overlapTolerance, 0.01);
    EXPECT_TRUE(settings.overlapScaleRelative);
    EXPECT_EQ(settings.textureSize, 2048);
    EXPECT_EQ(settings.polyCountLimit, 500);
    EXPECT_EQ(settings.expectedUnit, "m");
    EXPECT_EQ(settings.poleEdgeLimit, 6);
    EXPECT_EQ(settings.threadCount, 2);

    // Untouched keys keep their defaults.
    EXPECT_DOUBLE_EQ(settings.uvDistortionMax, 2.0);
}

TEST(SettingsIO, UnknownKeysWarn)
{
    CheckSettings      settings;
    SettingsLoadReport report;

    EXPECT_TRUE(applyCheckSettings({{"colour", "red"}}, settings, report));
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_NE(report.warnings[0].find("colour"), std::string::npos);
}

TEST(SettingsIO, InvalidValuesAreErrors)
{
    CheckSettings      settings;
    SettingsLoadReport report;

    const json config = {
        {"textureSize", 0},
        {"polyCountLimit", 1.5},
        {"expectedUnit", 3},
        {"overlapScaleRelative", "yes"},
        {"onBorderTolerance", -1.0},
        {"uvDistortionMin", 0.25},
    };

    EXPECT_FALSE(applyCheckSettings(config, settings, report));
    EXPECT_EQ(report.errors.size(), 5u);

    EXPECT_EQ(settings.textureSize, 1024);
    EXPECT_EQ(settings.polyCountLimit, 10000);
    EXPECT_EQ(settings.expectedUnit, "cm");
    EXPECT_FALSE(settings.overlapScaleRelative);
    EXPECT_DOUBLE_EQ(settings.onBorderTolerance, 1e-5);

    // Valid keys in the same document still apply.
    EXPECT_DOUBLE_EQ(settings.uvDistortionMin, 0.25);
}

TEST(SettingsIO, InvertedRangesAreErrors)
{
    CheckSettings      settings;
    SettingsLoadReport report;

    const json config = {
        {"uvDistortionMin", 3.0},
        {"texelDensityMin", 0.1},
        {"texelDensityMax", 0.05},
    };

    EXPECT_FALSE(applyCheckSettings(config, settings, report));
    ASSERT_EQ(report.errors.size(), 2u);
    EXPECT_NE(report.errors[0].find("uvDistortionMin"), std::string::npos);
    EXPECT_NE(report.errors[1].find("texelDensityMin"), std::string::npos);

    EXPECT_DOUBLE_EQ(settings.uvDistortionMin, 0.5);
    EXPECT_DOUBLE_EQ(settings.uvDistortionMax, 2.0);
    EXPECT_DOUBLE_EQ(settings.texelDensityMin, 0.5);
    EXPECT_DOUBLE_EQ(settings.texelDensityMax, 2.0);

    // Moving both ends together is fine.
    SettingsLoadReport shifted;
    EXPECT_TRUE(applyCheckSettings({{"uvDistortionMin", 3.0}, {"uvDistortionMax", 4.0}}, settings, shifted));
    EXPECT_DOUBLE_EQ(settings.uvDistortionMin, 3.0);
    EXPECT_DOUBLE_EQ(settings.uvDistortionMax, 4.0);
}

TEST(SettingsIO, RootMustBeAnObject)
{
    CheckSettings      settings;
    SettingsLoadReport report;

    EXPECT_FALSE(applyCheckSettings(json::array({1, 2}), settings, report));
    EXPECT_FALSE(report.ok());
}

TEST(SettingsIO, RoundTripThroughJson)
{
    CheckSettings custom;
    custom.uvRangeMaxU    = 4.0;
    custom.expectedUnit   = "in";
    custom.poleEdgeLimit  = 8;

    CheckSettings      loaded;
    SettingsLoadReport report;
    EXPECT_TRUE(applyCheckSettings(checkSettingsToJson(custom), loaded, report));
    EXPECT_TRUE(report.warnings.empty());

    EXPECT_DOUBLE_EQ(loaded.uvRangeMaxU, 4.0);
    EXPECT_EQ(loaded.expectedUnit, "in");
    EXPECT_EQ(loaded.poleEdgeLimit, 8);
}

TEST(SettingsIO, LoadFromFile)
{
    const auto path = write_temp("meshcheck_settings_ok.json", R"({ "polyCountLimit": 42, "expectedUnit": "mm" })");

    CheckSettings      settings;
    SettingsLoadReport report;
    EXPECT_TRUE(loadCheckSettings(path.string(), settings, report));
    EXPECT_EQ(settings.polyCountLimit, 42);
    EXPECT_EQ(settings.expectedUnit, "mm");

    std::filesystem::remove(path);
}

TEST(SettingsIO, LoadFailures)
{
    CheckSettings      settings;
    SettingsLoadReport missing;
    EXPECT_FALSE(loadCheckSettings("/nonexistent/meshcheck/settings.json", settings, missing));
    EXPECT_EQ(missing.errors.size(), 1u);

    const auto         path = write_temp("meshcheck_settings_bad.json", "{ \"polyCountLimit\": ");
    SettingsLoadReport broken;
    EXPECT_FALSE(loadCheckSettings(path.string(), settings, broken));
    EXPECT_EQ(broken.errors.size(), 1u);
    EXPECT_EQ(settings.polyCountLimit, 10000);

    std::filesystem::remove(path);
}
