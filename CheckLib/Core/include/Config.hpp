#pragma once

class CheckRegistry;

namespace config
{

    /**
     * @brief Register all built-in checks into the given registry.
     *
     * Ids, labels and categories follow the familiar model checker list
     * ("triangles" / "Triangles" / "topology", ...).
     */
    void registerChecks(CheckRegistry& registry);

} // namespace config
