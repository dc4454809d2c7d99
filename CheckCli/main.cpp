#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "CheckRegistry.hpp"
#include "CheckReport.hpp"
#include "CheckRunner.hpp"
#include "CheckSettingsIO.hpp"
#include "CliOptions.hpp"
#include "Config.hpp"
#include "MeshScene.hpp"

namespace
{
    constexpr int kExitPassed = 0;
    constexpr int kExitFailed = 1;
    constexpr int kExitUsage  = 2;

    void list_checks(const CheckRegistry& registry)
    {
        for (const std::string& id : registry.ids())
        {
            const CheckRegistry::Entry& entry = registry.get(id);
            std::cout << std::left << std::setw(22) << id
                      << std::setw(10) << entry.info.category
                      << std::setw(10) << resultKindName(entry.info.declaredKind)
                      << entry.info.label << "\n";
        }
    }

    bool write_json(const std::string& path, const CheckRun& run)
    {
        const std::string text = checkRunToJson(run).dump(2);

        if (path == "-")
        {
            std::cout << text << "\n";
            return true;
        }

        std::ofstream file(path);
        if (!file.is_open())
        {
            std::cerr << "Error: Could not open file " << path << "\n";
            return false;
        }

        file << text << "\n";
        return true;
    }
} // namespace

int main(int argc, char* argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);

    CliOptions  options;
    std::string error;
    if (!parseCliOptions(args, options, error))
    {
        std::cerr << "meshcheck: " << error << "\n\n" << cliUsage();
        return kExitUsage;
    }

    if (options.help)
    {
        std::cout << cliUsage();
        return kExitPassed;
    }

    CheckRegistry registry;
    config::registerChecks(registry);

    if (options.list)
    {
        list_checks(registry);
        if (options.inputs.empty())
            return kExitPassed;
    }

    CheckSettings settings;
    if (!options.settingsPath.empty())
    {
        SettingsLoadReport report;
        const bool         ok = loadCheckSettings(options.settingsPath, settings, report);

        for (const std::string& warn : report.warnings)
            std::cerr << "meshcheck: warning: " << warn << "\n";
        for (const std::string& err : report.errors)
            std::cerr << "meshcheck: error: " << err << "\n";

        if (!ok)
            return kExitUsage;
    }

    MeshScene scene;
    scene.setLinearUnit(options.unit);

    for (const std::string& path : options.inputs)
    {
        ObjLoadReport report;
        if (scene.loadObj(path, report).empty() && !report.ok())
            return kExitUsage;
    }

    scene.setSelection(options.selection);

    // JSON on stdout stays machine readable.
    std::ostream& summary = options.jsonPath == "-" ? std::cerr : std::cout;

    CheckRunner runner(registry, settings);
    const CheckRun run = options.checks.empty() ? runner.runAll(scene, options.scope)
                                                : runner.run(options.checks, scene, options.scope);

    writeTextSummary(summary, run, options.quiet);

    if (!options.jsonPath.empty() && !write_json(options.jsonPath, run))
        return kExitUsage;

    return run.allPassed() ? kExitPassed : kExitFailed;
}
