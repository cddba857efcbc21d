#pragma once

#include "ecs/Registry.hpp"
#include "rendering/IRenderer.hpp"

#include <optional>
#include <vector>

namespace neta {

/// Convex polygon packing for "Organize".
///
/// Shapes are stored as edge vectors (successive vertex differences of a
/// closed convex polygon) so Minkowski sums reduce to merging edges by angle.
/// Placement uses no-fit polygons: the vertices of placed ⊕ (-shape) are the
/// positions where the shape touches the placed one without overlapping it.
namespace Packing {

/// Default number of pieces each rectangle edge is split into.  More pieces
/// give more candidate positions along the sides of placed shapes.
constexpr int DEFAULT_SUBDIVISIONS = 2;

/// Clearance kept between organized frames, in world units
constexpr float DEFAULT_MARGIN = 10.0f;

/// Tolerance for overlap tests; shapes touching within it do not overlap
constexpr float OVERLAP_EPSILON = 1e-3f;

struct EdgeVectors {
    std::vector<Vec2> edges;

    EdgeVectors() = default;
    explicit EdgeVectors(std::vector<Vec2> e) : edges(std::move(e)) {}

    /// Rectangle of `size` rotated by `radians`, walked up, right, down and
    /// left from its bottom-left corner.  With `subdivisions` each edge is
    /// split into that many equal pieces.
    static EdgeVectors withRectSizeRotation(Vec2 size, float radians,
                                           std::optional<int> subdivisions = std::nullopt);

    /// Same polygon rotated half a turn
    EdgeVectors neg() const;

    /// Vertices with the first one at the origin.  The closing vertex is not
    /// repeated.
    std::vector<Vec2> localVertices() const;

    size_t size() const { return edges.size(); }
    bool empty() const { return edges.empty(); }
};

/// Minkowski sum of two convex polygons given as edge vectors
EdgeVectors minkowskiSum(const EdgeVectors& a, const EdgeVectors& b);

/// A polygon placed in the world, centered on `translation`
struct ShapePosition {
    Vec2 translation;
    EdgeVectors edges;

    /// World vertices, centered on the translation
    std::vector<Vec2> vertices() const;
};

/// True when `point` lies inside the convex polygon (either winding).
/// Points on an edge count as outside.
bool isInside(const std::vector<Vec2>& polygon, Vec2 point);

/// Separating axis test for two convex polygons.  Touching is not overlapping.
bool overlaps(const std::vector<Vec2>& a, const std::vector<Vec2>& b);

/// Move `shape` to the no-fit-polygon vertex closest to where it is now,
/// keeping `margin` clear of every placed shape.  Returns `shape` unchanged
/// when no candidate fits.
ShapePosition fill(const std::vector<ShapePosition>& placed, const ShapePosition& shape,
                   float margin = 0.0f);

/// Pack `shapes` around the last one, which keeps its place.  Returns the
/// shapes in input order with updated translations.
std::vector<ShapePosition> organize(const std::vector<ShapePosition>& shapes,
                                    float margin = DEFAULT_MARGIN);

/// Organize image frames: reads their world rectangles, packs them and
/// writes the translations back.  Entities without a sprite are skipped.
/// Returns the packed shapes for visualisation.
std::vector<ShapePosition> organizeFrames(Registry& registry, const std::vector<Entity>& frames,
                                          float margin = DEFAULT_MARGIN,
                                          int subdivisions = DEFAULT_SUBDIVISIONS);

} // namespace Packing

} // namespace neta
