#pragma once

#include <iosfwd>
#include <nlohmann/json.hpp>

#include "CheckRunner.hpp"

/**
 * @brief JSON document for one run.
 *
 * @code
 * { "meshCount": 2, "cancelled": false, "passed": false,
 *   "checks": [ { "checkId": "flippedNormals", "label": "Flipped Normals",
 *                 "category": "topology", "status": "failed",
 *                 "resultKind": "polygon", "entries": { "|cube|cube": [3] },
 *                 "message": "", "unevaluated": [] } ] }
 * @endcode
 *
 * Edge entries are [a, b] pairs, node entries map the mesh id to true and scene
 * flags use the key "scene".
 */
[[nodiscard]] nlohmann::json checkResultToJson(const AggregatedResult& result);

[[nodiscard]] nlohmann::json checkRunToJson(const CheckRun& run);

/**
 * @brief Human readable summary, one line per check plus the unevaluated meshes.
 * @param quiet Only list checks that did not pass.
 */
void writeTextSummary(std::ostream& out, const CheckRun& run, bool quiet = false);
