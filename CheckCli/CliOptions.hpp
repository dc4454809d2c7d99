#pragma once

#include <string>
#include <vector>

#include "CheckRunner.hpp"

/// Parsed command line of meshcheck.
struct CliOptions
{
    std::vector<std::string> inputs;       ///< OBJ files.
    std::vector<std::string> checks;       ///< Empty = every registered check.
    MeshScope                scope = MeshScope::wholeScene();
    std::vector<std::string> selection;    ///< Mesh ids for the selection scope.
    std::string              settingsPath; ///< Optional JSON settings file.
    std::string              unit = "cm";
    std::string              jsonPath;     ///< "-" writes to stdout.
    bool                     list  = false;
    bool                     quiet = false;
    bool                     help  = false;
};

/**
 * @brief Parse meshcheck arguments (without the program name).
 *
 * @param error Receives a message when parsing fails.
 * @return False on a usage error.
 */
bool parseCliOptions(const std::vector<std::string>& args, CliOptions& options, std::string& error);

/// @return The --help text.
[[nodiscard]] std::string cliUsage();
