#include "canvas/Packing.hpp"
#include "ecs/Components.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace neta {
namespace Packing {

EdgeVectors EdgeVectors::withRectSizeRotation(Vec2 size, float radians,
                                              std::optional<int> subdivisions) {
    const Vec2 sides[] = {
        {0.0f, -size.y},
        {size.x, 0.0f},
        {0.0f, size.y},
        {-size.x, 0.0f},
    };

    int pieces = std::max(1, subdivisions.value_or(1));
    std::vector<Vec2> edges;
    edges.reserve(4 * static_cast<size_t>(pieces));

    for (const Vec2& side : sides) {
        Vec2 piece = side.rotated(radians) / static_cast<float>(pieces);
        for (int i = 0; i < pieces; ++i) {
            edges.push_back(piece);
        }
    }
    return EdgeVectors(std::move(edges));
}

EdgeVectors EdgeVectors::neg() const {
    std::vector<Vec2> negated;
    negated.reserve(edges.size());
    for (const Vec2& edge : edges) {
        negated.push_back(-edge);
    }
    return EdgeVectors(std::move(negated));
}

std::vector<Vec2> EdgeVectors::localVertices() const {
    std::vector<Vec2> vertices;
    if (edges.empty()) {
        return vertices;
    }

    vertices.reserve(edges.size());
    Vec2 cursor;
    vertices.push_back(cursor);
    for (size_t i = 0; i + 1 < edges.size(); ++i) {
        cursor += edges[i];
        vertices.push_back(cursor);
    }
    return vertices;
}

EdgeVectors minkowskiSum(const EdgeVectors& a, const EdgeVectors& b) {
    std::vector<Vec2> merged;
    merged.reserve(a.size() + b.size());
    merged.insert(merged.end(), a.edges.begin(), a.edges.end());
    merged.insert(merged.end(), b.edges.begin(), b.edges.end());

    // Edges of a convex polygon turn monotonically; sorting the union by
    // direction walks the boundary of the sum
    std::stable_sort(merged.begin(), merged.end(), [](const Vec2& lhs, const Vec2& rhs) {
        return std::atan2(lhs.y, lhs.x) < std::atan2(rhs.y, rhs.x);
    });
    return EdgeVectors(std::move(merged));
}

std::vector<Vec2> ShapePosition::vertices() const {
    std::vector<Vec2> result = edges.localVertices();
    if (result.empty()) {
        return result;
    }

    Vec2 centroid;
    for (const Vec2& v : result) {
        centroid += v;
    }
    centroid /= static_cast<float>(result.size());

    for (Vec2& v : result) {
        v += translation - centroid;
    }
    return result;
}

bool isInside(const std::vector<Vec2>& polygon, Vec2 point) {
    if (polygon.size() < 3) {
        return false;
    }

    std::optional<bool> positive;
    for (size_t i = 0; i < polygon.size(); ++i) {
        Vec2 a = polygon[i];
        Vec2 b = polygon[(i + 1) % polygon.size()];
        bool side = Vec2::cross(b - a, point - a) > 0.0f;

        if (!positive) {
            positive = side;
        } else if (*positive != side) {
            return false;
        }
    }
    return true;
}

namespace {

void project(const std::vector<Vec2>& polygon, Vec2 axis, float& min, float& max) {
    min = std::numeric_limits<float>::max();
    max = std::numeric_limits<float>::lowest();
    for (const Vec2& v : polygon) {
        float p = Vec2::dot(v, axis);
        min = std::min(min, p);
        max = std::max(max, p);
    }
}

bool separatedAlongEdgesOf(const std::vector<Vec2>& polygon,
                           const std::vector<Vec2>& a, const std::vector<Vec2>& b) {
    for (size_t i = 0; i < polygon.size(); ++i) {
        Vec2 edge = polygon[(i + 1) % polygon.size()] - polygon[i];
        Vec2 axis = Vec2(-edge.y, edge.x).normalized();
        if (axis.lengthSquared() == 0.0f) continue;

        float minA, maxA, minB, maxB;
        project(a, axis, minA, maxA);
        project(b, axis, minB, maxB);
        if (maxA <= minB + OVERLAP_EPSILON || maxB <= minA + OVERLAP_EPSILON) {
            return true;
        }
    }
    return false;
}

/// Square of side `extent` as edge vectors, centered on its translation
EdgeVectors marginSquare(float extent) {
    return EdgeVectors::withRectSizeRotation({extent, extent}, 0.0f);
}

} // namespace

bool overlaps(const std::vector<Vec2>& a, const std::vector<Vec2>& b) {
    if (a.size() < 3 || b.size() < 3) {
        return false;
    }
    return !separatedAlongEdgesOf(a, a, b) && !separatedAlongEdgesOf(b, a, b);
}

ShapePosition fill(const std::vector<ShapePosition>& placed, const ShapePosition& shape,
                   float margin) {
    if (placed.empty() || shape.edges.empty()) {
        return shape;
    }

    // Placed shapes grown by the margin on every side
    std::vector<std::vector<Vec2>> obstacles;
    obstacles.reserve(placed.size());

    std::vector<Vec2> candidates;
    EdgeVectors reversed = shape.edges.neg();

    for (const ShapePosition& p : placed) {
        EdgeVectors grown = margin > 0.0f
            ? minkowskiSum(p.edges, marginSquare(2.0f * margin))
            : p.edges;
        obstacles.push_back(ShapePosition{p.translation, grown}.vertices());

        ShapePosition noFit{p.translation, minkowskiSum(grown, reversed)};
        auto vertices = noFit.vertices();
        candidates.insert(candidates.end(), vertices.begin(), vertices.end());
    }

    std::stable_sort(candidates.begin(), candidates.end(), [&](const Vec2& lhs, const Vec2& rhs) {
        return (lhs - shape.translation).lengthSquared() < (rhs - shape.translation).lengthSquared();
    });

    for (const Vec2& candidate : candidates) {
        ShapePosition moved{candidate, shape.edges};
        auto vertices = moved.vertices();

        bool blocked = std::any_of(obstacles.begin(), obstacles.end(),
            [&](const std::vector<Vec2>& obstacle) { return overlaps(obstacle, vertices); });
        if (!blocked) {
            return moved;
        }
    }

    return shape;
}

std::vector<ShapePosition> organize(const std::vector<ShapePosition>& shapes, float margin) {
    std::vector<ShapePosition> result = shapes;
    if (result.size() < 2) {
        return result;
    }

    std::vector<ShapePosition> placed;
    placed.reserve(result.size());
    placed.push_back(result.back());

    for (size_t i = 0; i + 1 < result.size(); ++i) {
        result[i] = fill(placed, result[i], margin);
        placed.push_back(result[i]);
    }
    return result;
}

std::vector<ShapePosition> organizeFrames(Registry& registry, const std::vector<Entity>& frames,
                                          float margin, int subdivisions) {
    std::vector<Entity> packed;
    std::vector<ShapePosition> shapes;

    for (Entity frame : frames) {
        const auto* transform = registry.tryGet<Transform>(frame);
        const auto* sprite = registry.tryGet<Sprite>(frame);
        if (!transform || !sprite) {
            continue;
        }

        Vec2 size{std::abs(sprite->size.x * transform->scale.x),
                  std::abs(sprite->size.y * transform->scale.y)};
        packed.push_back(frame);
        shapes.push_back(ShapePosition{
            transform->position,
            EdgeVectors::withRectSizeRotation(size, transform->rotation * DEG_TO_RAD, subdivisions),
        });
    }

    auto result = organize(shapes, margin);
    for (size_t i = 0; i < packed.size(); ++i) {
        registry.get<Transform>(packed[i]).position = result[i].translation;
    }

    LOG_INFO("Organized {} frames", packed.size());
    return result;
}

} // namespace Packing
} // namespace neta
