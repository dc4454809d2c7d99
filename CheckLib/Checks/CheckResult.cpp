#include "CheckResult.hpp"

#include <string>
#include <type_traits>

#include "CoreUtilities.hpp"

const char* resultKindName(ResultKind kind) noexcept
{
    switch (kind)
    {
        case ResultKind::Nodes:
            return "nodes";
        case ResultKind::Vertex:
            return "vertex";
        case ResultKind::Edge:
            return "edge";
        case ResultKind::Polygon:
            return "polygon";
        case ResultKind::Uv:
            return "uv";
        case ResultKind::SceneFlag:
            return "sceneFlag";
    }
    return "unknown";
}

ResultKind resultKind(const CheckResult& result) noexcept
{
    return std::visit([](const auto& r) { return r.kind; }, result);
}

bool resultEmpty(const CheckResult& result) noexcept
{
    return std::visit([](const auto& r) { return r.empty(); }, result);
}

CheckResult emptyResult(ResultKind kind)
{
    switch (kind)
    {
        case ResultKind::Nodes:
            return NodeResult{};
        case ResultKind::Vertex:
            return VertexResult{};
        case ResultKind::Edge:
            return EdgeResult{};
        case ResultKind::Polygon:
            return PolygonResult{};
        case ResultKind::Uv:
            return UvResult{};
        case ResultKind::SceneFlag:
            return SceneFlagResult{};
    }
    throw un::core_exception("Unknown result kind");
}

void mergeResult(CheckResult& into, const CheckResult& from)
{
    if (into.index() != from.index())
    {
        throw un::core_exception(std::string("Cannot merge a ") + resultKindName(resultKind(from)) +
                                 " result into a " + resultKindName(resultKind(into)) + " result");
    }

    std::visit(
        [&](auto& dst) {
            using T = std::decay_t<decltype(dst)>;
            dst.merge(std::get<T>(from));
        },
        into);
}
