#pragma once

#include "Check.hpp"

/**
 * @class ChkTriangles
 * @brief Flags faces with exactly 3 vertices.
 */
class ChkTriangles final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};

/**
 * @class ChkNgons
 * @brief Flags faces with more than 4 vertices.
 */
class ChkNgons final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};

/**
 * @class ChkPoles
 * @brief Flags vertices with more than CheckSettings::poleEdgeLimit connected edges.
 */
class ChkPoles final : public MeshCheck<VertexResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, VertexResult& result) const override;
};

/**
 * @class ChkLamina
 * @brief Flags faces built on exactly the same vertices as another face.
 */
class ChkLamina final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};

/**
 * @class ChkZeroAreaFaces
 * @brief Flags faces whose area is at most CheckSettings::zeroAreaTolerance.
 */
class ChkZeroAreaFaces final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};

/**
 * @class ChkZeroLengthEdges
 * @brief Flags edges whose length is at most CheckSettings::zeroLengthTolerance.
 */
class ChkZeroLengthEdges final : public MeshCheck<EdgeResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, EdgeResult& result) const override;
};

/**
 * @class ChkOpenEdges
 * @brief Flags border edges (used by fewer than 2 faces).
 */
class ChkOpenEdges final : public MeshCheck<EdgeResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, EdgeResult& result) const override;
};

/**
 * @class ChkNonManifoldEdges
 * @brief Flags edges shared by more than 2 faces.
 */
class ChkNonManifoldEdges final : public MeshCheck<EdgeResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, EdgeResult& result) const override;
};

/**
 * @class ChkConcaveFaces
 * @brief Flags faces with 4 or more vertices that turn both left and right
 * around their loop. Triangles are always convex.
 */
class ChkConcaveFaces final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};

/**
 * @class ChkHardEdges
 * @brief Flags interior edges whose two faces do not share their vertex normals.
 *
 * Shading comes from the normal map: an edge is hard when, at either of its
 * vertices, the two faces carry different normals. Border edges are never
 * flagged. Meshes without a normal map are smooth and pass.
 */
class ChkHardEdges final : public MeshCheck<EdgeResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, EdgeResult& result) const override;
};

/**
 * @class ChkStarlike
 * @brief Flags faces with no interior point that sees every corner.
 *
 * The kernel of the face (the intersection of the inner half-planes of all its
 * edges) is computed in the face plane. Triangles, convex faces and
 * degenerate faces pass.
 */
class ChkStarlike final : public MeshCheck<PolygonResult>
{
protected:
    void evaluate(const SysMeshId& id, const SysMesh& mesh, const CheckSettings& settings, PolygonResult& result) const override;
};
