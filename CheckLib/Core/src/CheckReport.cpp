#include "CheckReport.hpp"

#include <ostream>
#include <type_traits>

using json = nlohmann::json;

namespace
{
    json entries_to_json(const CheckResult& result)
    {
        json entries = json::object();

        std::visit(
            [&](const auto& r) {
                using T = std::decay_t<decltype(r)>;

                if constexpr (std::is_same_v<T, NodeResult>)
                {
                    for (const SysMeshId& id : r.meshes)
                        entries[id] = true;
                }
                else if constexpr (std::is_same_v<T, SceneFlagResult>)
                {
                    entries["scene"] = r.flagged;
                }
                else if constexpr (std::is_same_v<T, EdgeResult>)
                {
                    for (const auto& [id, edges] : r.entries)
                    {
                        json list = json::array();
                        for (const IndexPair& e : edges)
                            list.push_back(json::array({e.first, e.second}));
                        entries[id] = std::move(list);
                    }
                }
                else
                {
                    for (const auto& [id, indices] : r.entries)
                        entries[id] = json(indices);
                }
            },
            result);

        return entries;
    }

    size_t flagged_count(const CheckResult& result)
    {
        return std::visit(
            [](const auto& r) -> size_t {
                using T = std::decay_t<decltype(r)>;

                if constexpr (std::is_same_v<T, NodeResult>)
                    return r.meshes.size();
                else if constexpr (std::is_same_v<T, SceneFlagResult>)
                    return r.flagged ? 1 : 0;
                else
                {
                    size_t n = 0;
                    for (const auto& [id, indices] : r.entries)
                        n += indices.size();
                    return n;
                }
            },
            result);
    }

    const char* unit_name(ResultKind kind) noexcept
    {
        switch (kind)
        {
            case ResultKind::Nodes:
                return "mesh(es)";
            case ResultKind::Vertex:
                return "vertex(es)";
            case ResultKind::Edge:
                return "edge(s)";
            case ResultKind::Polygon:
                return "face(s)";
            case ResultKind::Uv:
                return "UV(s)";
            case ResultKind::SceneFlag:
                return "scene flag";
        }
        return "";
    }

    const char* status_tag(CheckStatus status) noexcept
    {
        switch (status)
        {
            case CheckStatus::Passed:
                return "[ OK ]";
            case CheckStatus::Failed:
                return "[FAIL]";
            case CheckStatus::ConfigurationFault:
                return "[CONF]";
            case CheckStatus::Unevaluated:
                return "[ ?? ]";
            case CheckStatus::Cancelled:
                return "[STOP]";
        }
        return "[    ]";
    }
} // namespace

json checkResultToJson(const AggregatedResult& result)
{
    json unevaluated = json::array();
    for (const UnevaluatedMesh& u : result.unevaluated)
        unevaluated.push_back({{"meshId", u.meshId}, {"reason", u.reason}});

    json out;
    out["checkId"]     = result.info.id;
    out["label"]       = result.info.label;
    out["category"]    = result.info.category;
    out["status"]      = checkStatusName(result.status);
    out["resultKind"]  = result.registered ? json(resultKindName(resultKind(result.result))) : json(nullptr);
    out["entries"]     = entries_to_json(result.result);
    out["message"]     = result.message;
    out["unevaluated"] = std::move(unevaluated);
    return out;
}

json checkRunToJson(const CheckRun& run)
{
    json checks = json::array();
    for (const AggregatedResult& r : run.results)
        checks.push_back(checkResultToJson(r));

    return json{
        {"meshCount", run.meshCount},
        {"cancelled", run.cancelled},
        {"passed", run.allPassed()},
        {"checks", std::move(checks)},
    };
}

void writeTextSummary(std::ostream& out, const CheckRun& run, bool quiet)
{
    size_t failing = 0;

    for (const AggregatedResult& r : run.results)
    {
        const bool ok = r.status == CheckStatus::Passed && r.unevaluated.empty();
        if (!ok)
            ++failing;

        if (quiet && ok)
            continue;

        out << status_tag(r.status) << " " << (r.info.label.empty() ? r.info.id : r.info.label);
        if (!r.info.label.empty())
            out << " (" << r.info.id << ")";

        if (r.status == CheckStatus::Failed && resultKind(r.result) != ResultKind::SceneFlag)
            out << ": " << flagged_count(r.result) << " " << unit_name(resultKind(r.result));

        if (!r.message.empty())
            out << ": " << r.message;

        out << "\n";

        for (const UnevaluatedMesh& u : r.unevaluated)
            out << "        not evaluated on " << u.meshId << ": " << u.reason << "\n";
    }

    out << run.results.size() - failing << "/" << run.results.size() << " checks passed on "
        << run.meshCount << " mesh(es)";
    if (run.cancelled)
        out << " (cancelled)";
    out << "\n";
}
