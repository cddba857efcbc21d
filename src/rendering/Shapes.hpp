#pragma once

#include "rendering/IRenderer.hpp"

#include <array>
#include <vector>

namespace neta {

/// Corners of a rotated rectangle in drawing order: top-left, top-right,
/// bottom-right, bottom-left.  Rotation in degrees around the center.
std::array<Vec2, 4> rotatedRectCorners(Vec2 center, Vec2 size, float rotation);

/// Closed outline of a rotated rectangle with rounded corners, for
/// IRenderer::drawPolyline.  The radius is clamped to half the shorter side.
std::vector<Vec2> roundedRectOutline(Vec2 center, Vec2 size, float rotation,
                                     float radius, int segmentsPerCorner = 6);

} // namespace neta
