#pragma once

#include "CheckResult.hpp"
#include "CheckSettings.hpp"

class SysMesh;
class SysMeshScene;

/// What a check is evaluated against.
enum class CheckTarget
{
    Mesh,  ///< Once per mesh in scope, results merged by mesh id.
    Scene, ///< Once per run.
};

/**
 * @class Check
 * @brief Base class for all mesh and scene checks.
 *
 * A check is a pure function of its input: it never modifies the mesh or the
 * scene and keeps no state between calls, so one instance can be evaluated on
 * several meshes concurrently.
 *
 * Concrete checks derive from MeshCheck<Result> or SceneCheck<Result>, which fix
 * kind() and target() from the result type.
 */
class Check
{
public:
    virtual ~Check() = default;

    /// @return The kind of result this check produces.
    [[nodiscard]] virtual ResultKind kind() const noexcept = 0;

    [[nodiscard]] virtual CheckTarget target() const noexcept = 0;

    /**
     * @brief Evaluate a per-mesh check.
     *
     * @param id   Id of the mesh, used as the key of the result entries.
     * @param mesh Immutable mesh snapshot (object space).
     * @param settings Thresholds.
     */
    [[nodiscard]] virtual CheckResult runMesh(const SysMeshId&     /*id*/,
                                              const SysMesh&       /*mesh*/,
                                              const CheckSettings& /*settings*/) const
    {
        return emptyResult(kind());
    }

    /// @brief Evaluate a scene check.
    [[nodiscard]] virtual CheckResult runScene(const SysMeshScene& /*scene*/, const CheckSettings& /*settings*/) const
    {
        return emptyResult(kind());
    }
};

/**
 * @brief Per-mesh check producing a @p Result.
 */
template<typename Result>
class MeshCheck : public Check
{
public:
    [[nodiscard]] ResultKind kind() const noexcept override
    {
        return Result::kind;
    }

    [[nodiscard]] CheckTarget target() const noexcept override
    {
        return CheckTarget::Mesh;
    }

    [[nodiscard]] CheckResult runMesh(const SysMeshId&     id,
                                      const SysMesh&       mesh,
                                      const CheckSettings& settings) const final
    {
        Result result;
        evaluate(id, mesh, settings, result);
        return result;
    }

protected:
    virtual void evaluate(const SysMeshId&     id,
                          const SysMesh&       mesh,
                          const CheckSettings& settings,
                          Result&              result) const = 0;
};

/**
 * @brief Scene check producing a @p Result.
 */
template<typename Result>
class SceneCheck : public Check
{
public:
    [[nodiscard]] ResultKind kind() const noexcept override
    {
        return Result::kind;
    }

    [[nodiscard]] CheckTarget target() const noexcept override
    {
        return CheckTarget::Scene;
    }

    [[nodiscard]] CheckResult runScene(const SysMeshScene& scene, const CheckSettings& settings) const final
    {
        Result result;
        evaluate(scene, settings, result);
        return result;
    }

protected:
    virtual void evaluate(const SysMeshScene& scene, const CheckSettings& settings, Result& result) const = 0;
};
