#include "ChkFlippedNormals.hpp"

#include <glm/glm.hpp>

#include "SysMesh.hpp"

void ChkFlippedNormals::evaluate(const SysMeshId&     id,
                                 const SysMesh&       mesh,
                                 const CheckSettings& /*settings*/,
                                 PolygonResult&       result) const
{
    const glm::vec3 center = mesh.bounding_box_center();

    for (int32_t poly = 0; poly < static_cast<int32_t>(mesh.num_polys()); ++poly)
    {
        const glm::vec3 outward = mesh.poly_center(poly) - center;
        const glm::vec3 normal  = mesh.poly_normal(poly);

        if (glm::dot(normal, outward) < 0.f)
            result.flag(id, poly);
    }
}
