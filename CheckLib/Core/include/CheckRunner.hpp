//=============================================================================
// CheckRunner.hpp
//=============================================================================
#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "CheckRegistry.hpp"
#include "CheckResult.hpp"
#include "CheckSettings.hpp"
#include "SysMeshScene.hpp"

/// Outcome of one check over one run.
enum class CheckStatus
{
    Passed,
    Failed,
    ConfigurationFault,
    Unevaluated,
    Cancelled
};

/// @return The report name of @p status ("passed", "failed", ...).
[[nodiscard]] const char* checkStatusName(CheckStatus status) noexcept;

/**
 * @brief Which meshes of the scene a run covers.
 */
struct MeshScope
{
    enum class Type
    {
        Selection,
        Hierarchy,
        WholeScene
    };

    Type      type = Type::Selection;
    SysMeshId root; ///< Hierarchy root, only used by Type::Hierarchy.

    static MeshScope selection()
    {
        return {Type::Selection, {}};
    }

    static MeshScope hierarchy(const SysMeshId& root)
    {
        return {Type::Hierarchy, root};
    }

    static MeshScope wholeScene()
    {
        return {Type::WholeScene, {}};
    }
};

/// A mesh a check could not be evaluated on.
struct UnevaluatedMesh
{
    SysMeshId   meshId;
    std::string reason;

    bool operator==(const UnevaluatedMesh& o) const = default;
};

/**
 * @brief Merged result of one check over every mesh of a run.
 */
struct AggregatedResult
{
    CheckInfo                    info;
    CheckStatus                  status = CheckStatus::Passed;
    CheckResult                  result;
    std::string                  message; ///< Fault or scene flag explanation.
    std::vector<UnevaluatedMesh> unevaluated;
    size_t                       evaluatedMeshes = 0;
    bool                         registered      = true; ///< False for unknown check ids.
};

/**
 * @brief All results of one run, in the order the checks were requested.
 */
struct CheckRun
{
    std::vector<AggregatedResult> results;
    size_t                        meshCount = 0;
    bool                          cancelled = false;

    /// @return The result of check @p id, or nullptr if it was not part of the run.
    [[nodiscard]] const AggregatedResult* find(const std::string& id) const noexcept;

    /// @return True if every check passed and every mesh could be evaluated.
    [[nodiscard]] bool allPassed() const noexcept;
};

/**
 * @class CheckRunner
 * @brief Dispatches registered checks over the meshes of a scope and merges the results.
 *
 * Meshes are split into chunks evaluated with std::async. Every task owns its
 * result buffers; buffers are merged once all tasks finished, so no shared state
 * is written concurrently. A mesh the scene cannot provide (null snapshot or
 * std::runtime_error) is recorded as unevaluated and the run continues.
 *
 * Scene checks run once on the calling thread, and only when the scope contains
 * at least one mesh.
 */
class CheckRunner
{
public:
    explicit CheckRunner(const CheckRegistry& registry, CheckSettings settings = {});

    /**
     * @brief Run the checks @p checkIds over the meshes of @p scope.
     *
     * Unknown ids and registry entries with a fault produce a ConfigurationFault
     * result for that id only. Duplicate ids are run once.
     */
    [[nodiscard]] CheckRun run(const std::vector<std::string>& checkIds,
                               const SysMeshScene&             scene,
                               const MeshScope&                scope);

    /// @brief Run every registered check.
    [[nodiscard]] CheckRun runAll(const SysMeshScene& scene, const MeshScope& scope);

    /**
     * @brief Request cancellation of the run in progress.
     *
     * Workers poll the flag between meshes; remaining checks report Cancelled.
     * The flag is cleared when the next run starts.
     */
    void cancel() noexcept;

    [[nodiscard]] bool cancelRequested() const noexcept;

    [[nodiscard]] const CheckSettings& settings() const noexcept
    {
        return m_settings;
    }

    void setSettings(const CheckSettings& settings)
    {
        m_settings = settings;
    }

private:
    const CheckRegistry& m_registry;
    CheckSettings        m_settings;
    std::atomic<bool>    m_cancel{false};
};
