#include <gtest/gtest.h>
#include "rendering/Shapes.hpp"

#include <cmath>

using namespace neta;

// =============================================================================
// Rotated rectangles
// =============================================================================

TEST(ShapesTest, CornersUnrotated) {
    auto corners = rotatedRectCorners({10.0f, 20.0f}, {4.0f, 2.0f}, 0.0f);
    EXPECT_FLOAT_EQ(corners[0].x, 8.0f);   // top-left
    EXPECT_FLOAT_EQ(corners[0].y, 19.0f);
    EXPECT_FLOAT_EQ(corners[1].x, 12.0f);  // top-right
    EXPECT_FLOAT_EQ(corners[1].y, 19.0f);
    EXPECT_FLOAT_EQ(corners[2].x, 12.0f);  // bottom-right
    EXPECT_FLOAT_EQ(corners[2].y, 21.0f);
    EXPECT_FLOAT_EQ(corners[3].x, 8.0f);   // bottom-left
    EXPECT_FLOAT_EQ(corners[3].y, 21.0f);
}

TEST(ShapesTest, CornersQuarterTurn) {
    // Clockwise on a y-down screen: the top-left corner swings to the top-right
    auto corners = rotatedRectCorners({0.0f, 0.0f}, {4.0f, 2.0f}, 90.0f);
    EXPECT_NEAR(corners[0].x, 1.0f, 1e-5f);
    EXPECT_NEAR(corners[0].y, -2.0f, 1e-5f);
    EXPECT_NEAR(corners[2].x, -1.0f, 1e-5f);
    EXPECT_NEAR(corners[2].y, 2.0f, 1e-5f);
}

TEST(ShapesTest, CornersKeepCenter) {
    Vec2 center(-7.0f, 3.0f);
    auto corners = rotatedRectCorners(center, {9.0f, 5.0f}, 33.0f);
    Vec2 sum;
    for (const Vec2& c : corners) sum += c;
    sum /= 4.0f;
    EXPECT_NEAR(sum.x, center.x, 1e-4f);
    EXPECT_NEAR(sum.y, center.y, 1e-4f);
}

// =============================================================================
// Rounded outlines
// =============================================================================

TEST(ShapesTest, ZeroRadiusIsPlainRectangle) {
    auto points = roundedRectOutline({0.0f, 0.0f}, {10.0f, 6.0f}, 0.0f, 0.0f);
    EXPECT_EQ(points.size(), 4u);
}

TEST(ShapesTest, PointCountFollowsSegments) {
    auto points = roundedRectOutline({0.0f, 0.0f}, {10.0f, 6.0f}, 0.0f, 2.0f, 6);
    EXPECT_EQ(points.size(), 4u * 7u);
}

TEST(ShapesTest, OutlineStaysInsideBounds) {
    auto points = roundedRectOutline({0.0f, 0.0f}, {10.0f, 6.0f}, 0.0f, 2.0f);
    float maxX = 0.0f;
    float maxY = 0.0f;
    for (const Vec2& p : points) {
        EXPECT_LE(std::abs(p.x), 5.0f + 1e-4f);
        EXPECT_LE(std::abs(p.y), 3.0f + 1e-4f);
        maxX = std::max(maxX, std::abs(p.x));
        maxY = std::max(maxY, std::abs(p.y));
    }
    EXPECT_NEAR(maxX, 5.0f, 1e-4f);
    EXPECT_NEAR(maxY, 3.0f, 1e-4f);
}

TEST(ShapesTest, CornersAreCutOff) {
    auto points = roundedRectOutline({0.0f, 0.0f}, {10.0f, 10.0f}, 0.0f, 3.0f);
    for (const Vec2& p : points) {
        bool atSharpCorner = std::abs(p.x) > 4.99f && std::abs(p.y) > 4.99f;
        EXPECT_FALSE(atSharpCorner);
    }
}

TEST(ShapesTest, RadiusClampedToHalfShortSide) {
    auto points = roundedRectOutline({0.0f, 0.0f}, {10.0f, 4.0f}, 0.0f, 100.0f);
    for (const Vec2& p : points) {
        EXPECT_LE(std::abs(p.x), 5.0f + 1e-4f);
        EXPECT_LE(std::abs(p.y), 2.0f + 1e-4f);
    }
}

TEST(ShapesTest, NegativeSizeUsesMagnitude) {
    auto points = roundedRectOutline({0.0f, 0.0f}, {-10.0f, 4.0f}, 0.0f, 1.0f);
    float maxX = 0.0f;
    for (const Vec2& p : points) maxX = std::max(maxX, std::abs(p.x));
    EXPECT_NEAR(maxX, 5.0f, 1e-4f);
}

TEST(ShapesTest, OutlineFollowsRotationAndCenter) {
    Vec2 center(100.0f, 50.0f);
    auto points = roundedRectOutline(center, {10.0f, 2.0f}, 90.0f, 0.5f);
    for (const Vec2& p : points) {
        // Long side is now vertical
        EXPECT_LE(std::abs(p.x - center.x), 1.0f + 1e-3f);
        EXPECT_LE(std::abs(p.y - center.y), 5.0f + 1e-3f);
    }
}
