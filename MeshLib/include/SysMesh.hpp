#ifndef SYS_MESH_HPP_INCLUDED
#define SYS_MESH_HPP_INCLUDED

#include <cstdint>
#include <glm/vec3.hpp>
#include <memory>
#include <span>
#include <utility>
#include <vector>

using IndexPair    = std::pair<int32_t, int32_t>;
using SysEdgePolys = std::vector<int32_t>;
using SysPolyVerts = std::vector<int32_t>;
using SysPolyEdges = std::vector<IndexPair>;

/// Map ids written by the OBJ importer (vn -> normals, vt -> texture coordinates).
constexpr int32_t kSysNormalMapId = 0;
constexpr int32_t kSysUvMapId     = 1;

/**
 * @brief Polygon mesh with face-varying maps (UVs, normals).
 *
 * Vertices and polygons are append-only: indices handed out by create_vert()
 * and create_poly() stay valid for the lifetime of the mesh, so a mesh that has
 * been populated can be shared read-only between threads.
 *
 * Copying is disabled; hand out std::shared_ptr<const SysMesh> snapshots instead.
 */
class SysMesh
{
public:
    explicit SysMesh();
    SysMesh(const SysMesh&)            = delete;
    SysMesh& operator=(const SysMesh&) = delete;

    SysMesh(SysMesh&& other) noexcept;
    SysMesh& operator=(SysMesh&& other) noexcept;

    ~SysMesh();

    /// Vertices ------------------------------------------

    /// @return The number of vertices in the mesh.
    [[nodiscard]] uint32_t num_verts() const noexcept;

    /// @return An index to a newly created vertex with the specified position.
    int32_t create_vert(const glm::vec3& pos);

    /// @return The position of the specified vertex.
    [[nodiscard]] const glm::vec3& vert_position(int32_t vert_index) const noexcept;

    /// @return All vertex positions, indexed by vertex index.
    [[nodiscard]] std::span<const glm::vec3> vert_positions() const noexcept;

    [[nodiscard]] bool vert_valid(int32_t vert_index) const noexcept;

    /// Edges ---------------------------------------------

    /// @return A list of all edges in the mesh (sorted, unique).
    [[nodiscard]] std::vector<IndexPair> all_edges() const;

    /// Returns a sorted edge (lowest index first) for stable edge comparisons
    static IndexPair sort_edge(const IndexPair& edge) noexcept;

    /// Polygons ------------------------------------------

    /// @return The number of polygons in the mesh.
    [[nodiscard]] uint32_t num_polys() const noexcept;

    /// @return An index to a newly created polygon with the specified vertices,
    /// or -1 if a vertex index does not exist.
    int32_t create_poly(const SysPolyVerts& verts);

    /// Reverses the winding of the polygon (and of its mapped polygons), flipping its normal.
    void reverse_poly(int32_t poly_index) noexcept;

    /// @return The vertices of the specified polygon.
    [[nodiscard]] const SysPolyVerts& poly_verts(int32_t poly_index) const noexcept;

    /// @return The edges of the specified polygon in winding order (not sorted).
    [[nodiscard]] SysPolyEdges poly_edges(int32_t poly_index) const;

    /// @return The unit normal of the polygon (Newell), or a zero vector for a degenerate polygon.
    [[nodiscard]] glm::vec3 poly_normal(int32_t poly_index) const noexcept;

    /// @return The center (vertex average) of the polygon.
    [[nodiscard]] glm::vec3 poly_center(int32_t poly_index) const noexcept;

    [[nodiscard]] bool poly_valid(int32_t poly_index) const noexcept;

    /// Bounds --------------------------------------------

    /// @return The minimum corner of the axis aligned bounds of all vertices.
    [[nodiscard]] glm::vec3 bounding_box_min() const noexcept;

    /// @return The maximum corner of the axis aligned bounds of all vertices.
    [[nodiscard]] glm::vec3 bounding_box_max() const noexcept;

    /// @return The center of the axis aligned bounds, or the origin for an empty mesh.
    [[nodiscard]] glm::vec3 bounding_box_center() const noexcept;

    /// Maps ----------------------------------------------

    /// @return A new map with the specified ID, type, dimensions.
    int32_t map_create(int32_t id, int32_t type, int32_t dim);

    /// @return The index of a map with the specified ID, or -1 if no such map
    /// is found.
    [[nodiscard]] int32_t map_find(int32_t id) const noexcept;

    /// @return The number of maps in the mesh.
    [[nodiscard]] int32_t num_maps() const noexcept;

    /// @return The dimensions of the vectors in the specified map.
    [[nodiscard]] int32_t map_dim(int32_t map) const noexcept;

    /// Creates (maps) a polygon with the specified map vertices.
    /// @return False if the corner count differs from the mesh polygon or a map vertex does not exist.
    bool map_create_poly(int32_t map, int32_t poly_index, const SysPolyVerts& pv);

    /// Creates a vertex entry in the map.
    int32_t map_create_vert(int32_t map, const float* vec);

    /// Returns true if the mesh map has the specified polygon mapped.
    [[nodiscard]] bool map_poly_valid(int32_t map, int32_t poly_index) const noexcept;

    /// @return The vertices of the specified mapped polygon.
    [[nodiscard]] const SysPolyVerts& map_poly_verts(int32_t map, int32_t poly_index) const noexcept;

    /// @return The position of the specified mapped vertex.
    [[nodiscard]] const float* map_vert_position(int32_t map, int32_t vert_index) const noexcept;

private:
    std::shared_ptr<struct SysMeshData> data;
};

#endif
