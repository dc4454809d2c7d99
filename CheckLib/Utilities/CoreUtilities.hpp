#pragma once

#include <cctype>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup CoreUtils Core Utilities
 * @brief Small string and error helpers shared by CheckLib and the CLI.
 */
namespace un
{

    /**
     * @brief Split @p text on @p sep, dropping empty pieces and surrounding blanks.
     * @ingroup CoreUtils
     *
     * "a, b,,c" -> {"a", "b", "c"}
     */
    inline std::vector<std::string> split_list(std::string_view text, char sep = ',')
    {
        std::vector<std::string> out;

        size_t start = 0;
        while (start <= text.size())
        {
            size_t end = text.find(sep, start);
            if (end == std::string_view::npos)
                end = text.size();

            std::string_view piece = text.substr(start, end - start);
            while (!piece.empty() && std::isspace(static_cast<unsigned char>(piece.front())))
                piece.remove_prefix(1);
            while (!piece.empty() && std::isspace(static_cast<unsigned char>(piece.back())))
                piece.remove_suffix(1);

            if (!piece.empty())
                out.emplace_back(piece);

            start = end + 1;
        }

        return out;
    }

    /**
     * @brief Create a runtime_error enriched with source location info.
     * @ingroup CoreUtils
     *
     * Example output:
     *   Unknown check "foo" [at CheckRegistry.cpp:42 in CheckRegistry::get]
     */
    inline std::runtime_error core_exception(
        const std::string&   msg,
        std::source_location loc = std::source_location::current())
    {
        // --- Shorten file name ---
        std::string file = loc.file_name();
        if (auto pos = file.find_last_of("/\\"); pos != std::string::npos)
            file = file.substr(pos + 1);

        // --- Keep the qualified name only ---
        std::string func = loc.function_name();
        if (auto open = func.find('('); open != std::string::npos)
            func.erase(open);
        if (auto space = func.find_last_of(' '); space != std::string::npos)
            func.erase(0, space + 1);

        return std::runtime_error(
            msg + " [at " + file + ":" + std::to_string(loc.line()) +
            " in " + func + "]");
    }

} // namespace un
