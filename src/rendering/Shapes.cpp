#include "rendering/Shapes.hpp"

#include <algorithm>
#include <cmath>

namespace neta {

std::array<Vec2, 4> rotatedRectCorners(Vec2 center, Vec2 size, float rotation) {
    float radians = rotation * DEG_TO_RAD;
    Vec2 half = size * 0.5f;
    return {
        center + Vec2(-half.x, -half.y).rotated(radians),
        center + Vec2( half.x, -half.y).rotated(radians),
        center + Vec2( half.x,  half.y).rotated(radians),
        center + Vec2(-half.x,  half.y).rotated(radians),
    };
}

std::vector<Vec2> roundedRectOutline(Vec2 center, Vec2 size, float rotation,
                                     float radius, int segmentsPerCorner) {
    Vec2 half{std::abs(size.x) * 0.5f, std::abs(size.y) * 0.5f};
    radius = std::clamp(radius, 0.0f, std::min(half.x, half.y));

    if (radius <= 0.0f || segmentsPerCorner < 1) {
        auto corners = rotatedRectCorners(center, size, rotation);
        return {corners.begin(), corners.end()};
    }

    // Arc centers in local space, clockwise on screen starting top-left,
    // each paired with the angle its arc starts at
    const std::array<std::pair<Vec2, float>, 4> arcs = {{
        {{-half.x + radius, -half.y + radius}, PI},
        {{ half.x - radius, -half.y + radius}, PI * 1.5f},
        {{ half.x - radius,  half.y - radius}, 0.0f},
        {{-half.x + radius,  half.y - radius}, PI * 0.5f},
    }};

    float radians = rotation * DEG_TO_RAD;
    std::vector<Vec2> points;
    points.reserve(arcs.size() * (segmentsPerCorner + 1));

    for (const auto& [arcCenter, startAngle] : arcs) {
        for (int i = 0; i <= segmentsPerCorner; ++i) {
            float angle = startAngle + (PI * 0.5f) * static_cast<float>(i) / segmentsPerCorner;
            Vec2 local = arcCenter + Vec2(std::cos(angle), std::sin(angle)) * radius;
            points.push_back(center + local.rotated(radians));
        }
    }
    return points;
}

} // namespace neta
