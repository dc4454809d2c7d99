//=============================================================================
// CheckRegistry.hpp
//=============================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "CheckResult.hpp"

class Check;

/**
 * @brief Metadata shown next to a check in reports and listings.
 */
struct CheckInfo
{
    std::string id;                                ///< Stable identifier ("flippedNormals").
    std::string label;                             ///< Human readable name ("Flipped Normals").
    std::string category;                          ///< Grouping ("topology", "UVs", ...).
    ResultKind  declaredKind = ResultKind::Nodes; ///< Kind the registration promises.
};

/**
 * @class CheckRegistry
 * @brief Runtime registry mapping check ids to check instances and metadata.
 *
 * Each registered factory is invoked once; checks are stateless so the single
 * instance is shared by every run and every worker thread.
 *
 * The kind promised at registration is compared with Check::kind(). A mismatch
 * does not reject the registration: the entry is stored with a fault message,
 * and dispatching that id reports a configuration fault for that id only.
 *
 * Usage example:
 * @code
 * CheckRegistry registry;
 * registry.registerCheck({"triangles", "Triangles", "topology", ResultKind::Polygon},
 *                        &CheckRegistry::createCheckType<ChkTriangles>);
 * @endcode
 */
class CheckRegistry
{
public:
    /// Function used to create the check instance.
    using CreateFunc = std::function<std::unique_ptr<Check>()>;

    struct Entry
    {
        CheckInfo                    info;
        std::shared_ptr<const Check> check;
        std::string                  fault; ///< Non-empty if the entry cannot be dispatched.

        [[nodiscard]] bool valid() const noexcept
        {
            return check && fault.empty();
        }
    };

    CheckRegistry() = default;

    /**
     * @brief Register a check under info.id.
     *
     * If the id already exists, the previous entry is replaced and keeps its
     * position in ids().
     *
     * @return True if the entry can be dispatched, false if it was stored with a fault.
     */
    bool registerCheck(const CheckInfo& info, const CreateFunc& createFunc);

    /// @return The entry for @p id, or nullptr if no such check is registered.
    [[nodiscard]] const Entry* find(const std::string& id) const noexcept;

    /**
     * @return The entry for @p id.
     * @throws std::runtime_error if no such check is registered.
     */
    [[nodiscard]] const Entry& get(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const noexcept;

    /// @return All registered ids in registration order.
    [[nodiscard]] const std::vector<std::string>& ids() const noexcept
    {
        return m_order;
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return m_order.size();
    }

    /**
     * @brief Helper that constructs checks of a specific derived type.
     * @tparam Derived The concrete check type.
     */
    template<typename Derived>
    static std::unique_ptr<Check> createCheckType()
    {
        return std::make_unique<Derived>();
    }

private:
    std::unordered_map<std::string, Entry> m_entries;
    std::vector<std::string>               m_order;
};
