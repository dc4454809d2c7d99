//=============================================================================
// CheckRunner.cpp
//=============================================================================
#include "CheckRunner.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <unordered_set>

#include "Check.hpp"
#include "SysMesh.hpp"

namespace
{
    // Per-task output. Indexed like the list of mesh checks of the run.
    struct ChunkOutput
    {
        std::vector<CheckResult>                  results;
        std::vector<std::vector<UnevaluatedMesh>> unevaluated;
        std::vector<size_t>                       evaluated;
        std::vector<std::string>                  faults;
        bool                                      cancelled = false;
    };

    std::vector<SysMeshId> resolve_scope(const SysMeshScene& scene, const MeshScope& scope)
    {
        std::vector<SysMeshId> ids;
        switch (scope.type)
        {
            case MeshScope::Type::Selection:
                ids = scene.selectedMeshIds();
                break;
            case MeshScope::Type::Hierarchy:
                ids = scene.hierarchyMeshIds(scope.root);
                break;
            case MeshScope::Type::WholeScene:
                ids = scene.allMeshIds();
                break;
        }

        // First occurrence wins.
        std::unordered_set<SysMeshId> seen;
        std::vector<SysMeshId>        unique;
        unique.reserve(ids.size());
        for (SysMeshId& id : ids)
        {
            if (seen.insert(id).second)
                unique.push_back(std::move(id));
        }
        return unique;
    }

    size_t worker_count(int32_t threadCount, size_t meshCount) noexcept
    {
        size_t workers = threadCount > 0 ? static_cast<size_t>(threadCount)
                                         : static_cast<size_t>(std::max(1u, std::thread::hardware_concurrency()));
        return std::max<size_t>(1, std::min(workers, meshCount));
    }
} // namespace

// ------------------------------------------------------------

const char* checkStatusName(CheckStatus status) noexcept
{
    switch (status)
    {
        case CheckStatus::Passed:
            return "passed";
        case CheckStatus::Failed:
            return "failed";
        case CheckStatus::ConfigurationFault:
            return "configurationFault";
        case CheckStatus::Unevaluated:
            return "unevaluated";
        case CheckStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

const AggregatedResult* CheckRun::find(const std::string& id) const noexcept
{
    for (const AggregatedResult& r : results)
    {
        if (r.info.id == id)
            return &r;
    }
    return nullptr;
}

bool CheckRun::allPassed() const noexcept
{
    return std::ranges::all_of(results, [](const AggregatedResult& r) {
        return r.status == CheckStatus::Passed && r.unevaluated.empty();
    });
}

// ------------------------------------------------------------

CheckRunner::CheckRunner(const CheckRegistry& registry, CheckSettings settings) :
    m_registry{registry},
    m_settings{std::move(settings)}
{
}

void CheckRunner::cancel() noexcept
{
    m_cancel.store(true, std::memory_order_relaxed);
}

bool CheckRunner::cancelRequested() const noexcept
{
    return m_cancel.load(std::memory_order_relaxed);
}

CheckRun CheckRunner::runAll(const SysMeshScene& scene, const MeshScope& scope)
{
    return run(m_registry.ids(), scene, scope);
}

CheckRun CheckRunner::run(const std::vector<std::string>& checkIds,
                          const SysMeshScene&             scene,
                          const MeshScope&                scope)
{
    m_cancel.store(false, std::memory_order_relaxed);

    CheckRun out;

    // ------------------------------------------------------------
    // Resolve checks
    // ------------------------------------------------------------

    std::vector<const CheckRegistry::Entry*> meshChecks;
    std::vector<size_t>                      meshSlots; // meshChecks[i] -> out.results index
    std::vector<const CheckRegistry::Entry*> sceneChecks;
    std::vector<size_t>                      sceneSlots;

    std::unordered_set<std::string> requested;
    for (const std::string& id : checkIds)
    {
        if (!requested.insert(id).second)
            continue;

        AggregatedResult agg;
        agg.info.id = id;

        const CheckRegistry::Entry* entry = m_registry.find(id);
        if (!entry)
        {
            agg.registered = false;
            agg.status     = CheckStatus::ConfigurationFault;
            agg.message    = "Unknown check id '" + id + "'";
            out.results.push_back(std::move(agg));
            continue;
        }

        agg.info   = entry->info;
        agg.result = emptyResult(entry->info.declaredKind);

        if (!entry->valid())
        {
            agg.status  = CheckStatus::ConfigurationFault;
            agg.message = entry->fault;
            out.results.push_back(std::move(agg));
            continue;
        }

        if (entry->check->target() == CheckTarget::Mesh)
        {
            meshChecks.push_back(entry);
            meshSlots.push_back(out.results.size());
        }
        else
        {
            sceneChecks.push_back(entry);
            sceneSlots.push_back(out.results.size());
        }
        out.results.push_back(std::move(agg));
    }

    // ------------------------------------------------------------
    // Resolve meshes
    // ------------------------------------------------------------

    std::vector<SysMeshId> meshIds;
    try
    {
        meshIds = resolve_scope(scene, scope);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "CheckRunner::run(): scope could not be resolved: " << e.what() << "\n";

        auto mark = [&](size_t slot) {
            out.results[slot].status  = CheckStatus::Unevaluated;
            out.results[slot].message = std::string("Scope could not be resolved: ") + e.what();
        };
        std::ranges::for_each(meshSlots, mark);
        std::ranges::for_each(sceneSlots, mark);
        return out;
    }

    out.meshCount = meshIds.size();

    // ------------------------------------------------------------
    // Per-mesh checks
    // ------------------------------------------------------------

    auto evaluateChunk = [&](size_t begin, size_t end) {
        ChunkOutput chunk;
        chunk.results.reserve(meshChecks.size());
        for (const CheckRegistry::Entry* entry : meshChecks)
            chunk.results.push_back(emptyResult(entry->info.declaredKind));
        chunk.unevaluated.resize(meshChecks.size());
        chunk.evaluated.resize(meshChecks.size(), 0);
        chunk.faults.resize(meshChecks.size());

        for (size_t m = begin; m < end; ++m)
        {
            if (m_cancel.load(std::memory_order_relaxed))
            {
                chunk.cancelled = true;
                break;
            }

            const SysMeshId& id = meshIds[m];

            std::shared_ptr<const SysMesh> mesh;
            std::string                    reason;
            try
            {
                mesh = scene.mesh(id);
                if (!mesh)
                    reason = "Mesh is no longer available";
            }
            catch (const std::runtime_error& e)
            {
                reason = e.what();
            }

            if (!mesh)
            {
                for (auto& list : chunk.unevaluated)
                    list.push_back({id, reason});
                continue;
            }

            for (size_t c = 0; c < meshChecks.size(); ++c)
            {
                if (!chunk.faults[c].empty())
                    continue;

                const CheckRegistry::Entry& entry = *meshChecks[c];
                try
                {
                    CheckResult result = entry.check->runMesh(id, *mesh, m_settings);
                    if (resultKind(result) != entry.info.declaredKind)
                    {
                        chunk.faults[c] = std::string("Check produced a ") + resultKindName(resultKind(result)) +
                                          " result, declared " + resultKindName(entry.info.declaredKind);
                        continue;
                    }

                    mergeResult(chunk.results[c], result);
                    ++chunk.evaluated[c];
                }
                catch (const std::exception& e)
                {
                    chunk.unevaluated[c].push_back({id, e.what()});
                }
            }
        }

        return chunk;
    };

    std::vector<ChunkOutput> chunks;
    if (!meshChecks.empty() && !meshIds.empty())
    {
        const size_t workers = worker_count(m_settings.threadCount, meshIds.size());

        if (workers == 1)
        {
            chunks.push_back(evaluateChunk(0, meshIds.size()));
        }
        else
        {
            std::vector<std::future<ChunkOutput>> futures;
            futures.reserve(workers);

            const size_t chunkSize = meshIds.size() / workers;
            for (size_t t = 0; t < workers; ++t)
            {
                const size_t begin = t * chunkSize;
                const size_t end   = (t == workers - 1) ? meshIds.size() : (t + 1) * chunkSize;

                futures.push_back(std::async(std::launch::async, evaluateChunk, begin, end));
            }

            // Barrier: collect in chunk order so the merge is deterministic.
            for (auto& future : futures)
                chunks.push_back(future.get());
        }
    }

    // ------------------------------------------------------------
    // Merge
    // ------------------------------------------------------------

    for (const ChunkOutput& chunk : chunks)
        out.cancelled = out.cancelled || chunk.cancelled;

    for (size_t c = 0; c < meshChecks.size(); ++c)
    {
        AggregatedResult& agg = out.results[meshSlots[c]];

        for (const ChunkOutput& chunk : chunks)
        {
            if (!chunk.faults[c].empty() && agg.message.empty())
                agg.message = chunk.faults[c];

            mergeResult(agg.result, chunk.results[c]);
            agg.unevaluated.insert(agg.unevaluated.end(), chunk.unevaluated[c].begin(), chunk.unevaluated[c].end());
            agg.evaluatedMeshes += chunk.evaluated[c];
        }

        if (!agg.message.empty())
        {
            agg.status = CheckStatus::ConfigurationFault;
            agg.result = emptyResult(agg.info.declaredKind);
        }
        else if (out.cancelled)
            agg.status = CheckStatus::Cancelled;
        else if (agg.evaluatedMeshes == 0 && !agg.unevaluated.empty())
            agg.status = CheckStatus::Unevaluated;
        else
            agg.status = resultEmpty(agg.result) ? CheckStatus::Passed : CheckStatus::Failed;
    }

    // ------------------------------------------------------------
    // Scene checks
    // ------------------------------------------------------------

    for (size_t c = 0; c < sceneChecks.size(); ++c)
    {
        const CheckRegistry::Entry& entry = *sceneChecks[c];
        AggregatedResult&           agg   = out.results[sceneSlots[c]];

        if (out.cancelled || m_cancel.load(std::memory_order_relaxed))
        {
            out.cancelled = true;
            agg.status    = CheckStatus::Cancelled;
            continue;
        }

        // Nothing in scope: nothing to report on.
        if (meshIds.empty())
            continue;

        try
        {
            CheckResult result = entry.check->runScene(scene, m_settings);
            if (resultKind(result) != entry.info.declaredKind)
            {
                agg.status  = CheckStatus::ConfigurationFault;
                agg.message = std::string("Check produced a ") + resultKindName(resultKind(result)) +
                              " result, declared " + resultKindName(entry.info.declaredKind);
                continue;
            }

            agg.result = std::move(result);
            agg.status = resultEmpty(agg.result) ? CheckStatus::Passed : CheckStatus::Failed;

            if (const auto* flag = std::get_if<SceneFlagResult>(&agg.result))
                agg.message = flag->message;
        }
        catch (const std::exception& e)
        {
            std::cerr << "CheckRunner::run(): " << entry.info.id << ": " << e.what() << "\n";
            agg.status  = CheckStatus::Unevaluated;
            agg.message = e.what();
        }
    }

    return out;
}
