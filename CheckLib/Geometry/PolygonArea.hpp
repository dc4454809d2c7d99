#pragma once

#include <cstdint>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <span>
#include <vector>

class SysMesh;

namespace geo
{

    /**
     * @brief Area of a planar (or nearly planar) 3D polygon using Newell's method.
     *
     * Half the magnitude of the summed edge cross products. Fewer than 3 points or
     * a collapsed loop give 0. The result does not depend on the start corner or
     * on the winding direction.
     */
    [[nodiscard]] double polygonArea3D(std::span<const glm::vec3> points) noexcept;

    /**
     * @brief Unsigned area of a UV polygon (shoelace formula).
     */
    [[nodiscard]] double polygonAreaUV(std::span<const glm::vec2> uvs) noexcept;

    /// @return The 3D area of polygon @p poly of @p mesh.
    [[nodiscard]] double polyArea(const SysMesh& mesh, int32_t poly);

    /// @return The UV coordinates of polygon @p poly in map @p map, or an empty loop if unmapped.
    [[nodiscard]] std::vector<glm::vec2> polyUvLoop(const SysMesh& mesh, int32_t map, int32_t poly);

    /// @return The UV area of polygon @p poly in map @p map, 0 if the polygon is unmapped.
    [[nodiscard]] double polyUvArea(const SysMesh& mesh, int32_t map, int32_t poly);

} // namespace geo
