#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <variant>

#include "SysMesh.hpp"
#include "SysMeshScene.hpp"

/// What a check reports on. A check always produces the same kind.
enum class ResultKind
{
    Nodes,
    Vertex,
    Edge,
    Polygon,
    Uv,
    SceneFlag
};

/// @return The report name of @p kind ("nodes", "vertex", "edge", "polygon", "uv", "sceneFlag").
[[nodiscard]] const char* resultKindName(ResultKind kind) noexcept;

/**
 * @brief Whole meshes flagged by a check.
 */
struct NodeResult
{
    static constexpr ResultKind kind = ResultKind::Nodes;

    std::set<SysMeshId> meshes;

    [[nodiscard]] bool empty() const noexcept
    {
        return meshes.empty();
    }

    void flag(const SysMeshId& id)
    {
        meshes.insert(id);
    }

    void merge(const NodeResult& other)
    {
        meshes.insert(other.meshes.begin(), other.meshes.end());
    }

    bool operator==(const NodeResult& o) const = default;
};

/**
 * @brief Mesh id -> flagged component indices (vertices, edges, polygons or UVs).
 *
 * Meshes without flagged components never appear in @ref entries.
 */
template<ResultKind K, typename Index>
struct ComponentResult
{
    static constexpr ResultKind kind = K;

    using IndexSet = std::set<Index>;

    std::map<SysMeshId, IndexSet> entries;

    [[nodiscard]] bool empty() const noexcept
    {
        return entries.empty();
    }

    void flag(const SysMeshId& id, const Index& index)
    {
        entries[id].insert(index);
    }

    void flag(const SysMeshId& id, IndexSet indices)
    {
        if (indices.empty())
            return;

        IndexSet& dst = entries[id];
        if (dst.empty())
            dst = std::move(indices);
        else
            dst.insert(indices.begin(), indices.end());
    }

    void merge(const ComponentResult& other)
    {
        for (const auto& [id, indices] : other.entries)
            flag(id, indices);
    }

    bool operator==(const ComponentResult& o) const = default;
};

using VertexResult  = ComponentResult<ResultKind::Vertex, int32_t>;
using EdgeResult    = ComponentResult<ResultKind::Edge, IndexPair>; ///< Edge keys are sorted, lowest index first.
using PolygonResult = ComponentResult<ResultKind::Polygon, int32_t>;
using UvResult      = ComponentResult<ResultKind::Uv, int32_t>;

/**
 * @brief Scene wide yes/no result with an explanation.
 */
struct SceneFlagResult
{
    static constexpr ResultKind kind = ResultKind::SceneFlag;

    bool        flagged = false;
    std::string message;

    [[nodiscard]] bool empty() const noexcept
    {
        return !flagged;
    }

    void merge(const SceneFlagResult& other)
    {
        flagged = flagged || other.flagged;
        if (message.empty())
            message = other.message;
    }

    bool operator==(const SceneFlagResult& o) const = default;
};

using CheckResult = std::variant<NodeResult, VertexResult, EdgeResult, PolygonResult, UvResult, SceneFlagResult>;

/// @return The kind held by @p result.
[[nodiscard]] ResultKind resultKind(const CheckResult& result) noexcept;

/// @return True if @p result flags nothing (the check passed).
[[nodiscard]] bool resultEmpty(const CheckResult& result) noexcept;

/// @return An empty result of @p kind.
[[nodiscard]] CheckResult emptyResult(ResultKind kind);

/**
 * @brief Merge @p from into @p into.
 * @throws std::runtime_error if the two results hold different kinds.
 */
void mergeResult(CheckResult& into, const CheckResult& from);
