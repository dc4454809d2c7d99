#include "ChkOverlappingVertices.hpp"

#include <glm/glm.hpp>
#include <vector>

#include "SpatialHashGrid.hpp"
#include "SysMesh.hpp"

void ChkOverlappingVertices::evaluate(const SysMeshId&     id,
                                      const SysMesh&       mesh,
                                      const CheckSettings& settings,
                                      VertexResult&        result) const
{
    if (mesh.num_verts() < 2)
        return;

    double tolerance = settings.overlapTolerance;
    if (settings.overlapScaleRelative)
        tolerance *= glm::length(glm::dvec3(mesh.bounding_box_max() - mesh.bounding_box_min()));

    const geo::SpatialHashGrid grid(mesh.vert_positions(), tolerance);

    const std::vector<int32_t> points = grid.overlappingPoints();
    result.flag(id, VertexResult::IndexSet(points.begin(), points.end()));
}
