#include "CliOptions.hpp"

#include <utility>

#include "CoreUtilities.hpp"

namespace
{
    bool parse_scope(const std::string& text, MeshScope& scope)
    {
        if (text == "selection")
            scope = MeshScope::selection();
        else if (text == "scene")
            scope = MeshScope::wholeScene();
        else if (text.rfind("hierarchy:", 0) == 0 && text.size() > 10)
            scope = MeshScope::hierarchy(text.substr(10));
        else
            return false;

        return true;
    }
} // namespace

std::string cliUsage()
{
    return "Usage: meshcheck [options] file.obj [file.obj ...]\n"
           "\n"
           "Options:\n"
           "  -c, --checks id[,id...]      checks to run (default: all registered)\n"
           "  -s, --scope selection|scene|hierarchy:<root>\n"
           "                               meshes to check (default: scene)\n"
           "      --select id[,id...]      selected meshes for the selection scope\n"
           "      --settings file.json     settings overrides\n"
           "      --unit name              scene linear unit (default: cm)\n"
           "  -j, --json file|-            write a JSON report ('-' for stdout)\n"
           "  -l, --list                   list registered checks\n"
           "  -q, --quiet                  only print checks that did not pass\n"
           "  -h, --help                   show this help\n"
           "\n"
           "Mesh ids are '|<file stem>|<object>'.\n"
           "Exit code: 0 all checks passed, 1 a check failed or could not be evaluated,\n"
           "2 usage or load error.\n";
}

bool parseCliOptions(const std::vector<std::string>& args, CliOptions& options, std::string& error)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        std::string arg = args[i];
        std::string value;
        bool        hasInlineValue = false;

        // --option=value
        if (arg.rfind("--", 0) == 0)
        {
            if (auto eq = arg.find('='); eq != std::string::npos)
            {
                value          = arg.substr(eq + 1);
                arg            = arg.substr(0, eq);
                hasInlineValue = true;
            }
        }

        auto takeValue = [&]() -> bool {
            if (hasInlineValue)
                return true;

            // "-" alone is a value (stdout), anything else starting with '-' is an option.
            if (i + 1 >= args.size() || (args[i + 1].size() > 1 && args[i + 1][0] == '-'))
            {
                error = "Option " + arg + " requires a value";
                return false;
            }
            value = args[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            options.help = true;
        }
        else if (arg == "-l" || arg == "--list")
        {
            options.list = true;
        }
        else if (arg == "-q" || arg == "--quiet")
        {
            options.quiet = true;
        }
        else if (arg == "-c" || arg == "--checks")
        {
            if (!takeValue())
                return false;
            for (std::string& id : un::split_list(value))
                options.checks.push_back(std::move(id));
        }
        else if (arg == "-s" || arg == "--scope")
        {
            if (!takeValue())
                return false;
            if (!parse_scope(value, options.scope))
            {
                error = "Invalid scope '" + value + "'";
                return false;
            }
        }
        else if (arg == "--select")
        {
            if (!takeValue())
                return false;
            for (std::string& id : un::split_list(value))
                options.selection.push_back(std::move(id));
        }
        else if (arg == "--settings")
        {
            if (!takeValue())
                return false;
            options.settingsPath = value;
        }
        else if (arg == "--unit")
        {
            if (!takeValue())
                return false;
            options.unit = value;
        }
        else if (arg == "-j" || arg == "--json")
        {
            if (!takeValue())
                return false;
            options.jsonPath = value;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            error = "Unknown option: " + arg;
            return false;
        }
        else
        {
            options.inputs.push_back(arg);
        }
    }

    if (!options.help && !options.list && options.inputs.empty())
    {
        error = "No input files";
        return false;
    }

    return true;
}
