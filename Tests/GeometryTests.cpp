#include <gtest/gtest.h>

#include "Utils/Geometry.hpp"
#include "ecs/Collisions/CollisionHelpers.hpp"

#include <glm/gtc/constants.hpp>

namespace {
    const glm::vec2 PLAYFIELD(1280.0f, 1024.0f);
}

TEST(GeometryTests, WrapHandlesNegativeCoordinates) {
    glm::vec2 wrapped = Geometry::Wrap(glm::vec2(-10.0f, 1034.0f), PLAYFIELD);
    EXPECT_FLOAT_EQ(wrapped.x, 1270.0f);
    EXPECT_FLOAT_EQ(wrapped.y, 10.0f);
}

TEST(GeometryTests, WrapHandlesPositionsManyPlayfieldsAway) {
    glm::vec2 wrapped = Geometry::Wrap(glm::vec2(1280.0f * 5.0f + 3.0f, -1024.0f * 7.0f - 4.0f), PLAYFIELD);
    EXPECT_FLOAT_EQ(wrapped.x, 3.0f);
    EXPECT_FLOAT_EQ(wrapped.y, 1020.0f);
}

TEST(GeometryTests, WrapAlwaysLandsInsideThePlayfield) {
    for (float v = -50000.0f; v <= 50000.0f; v += 123.37f) {
        glm::vec2 wrapped = Geometry::Wrap(glm::vec2(v, -v), PLAYFIELD);
        EXPECT_GE(wrapped.x, 0.0f);
        EXPECT_LT(wrapped.x, PLAYFIELD.x);
        EXPECT_GE(wrapped.y, 0.0f);
        EXPECT_LT(wrapped.y, PLAYFIELD.y);
    }
}

TEST(GeometryTests, WrapOfTinyNegativeValueStaysBelowSize) {
    float wrapped = Geometry::WrapScalar(-1e-7f, 1280.0f);
    EXPECT_GE(wrapped, 0.0f);
    EXPECT_LT(wrapped, 1280.0f);
}

TEST(GeometryTests, WrapKeepsInsideValuesUnchanged) {
    glm::vec2 wrapped = Geometry::Wrap(glm::vec2(640.0f, 0.0f), PLAYFIELD);
    EXPECT_FLOAT_EQ(wrapped.x, 640.0f);
    EXPECT_FLOAT_EQ(wrapped.y, 0.0f);
}

TEST(GeometryTests, WrapDegreesHandlesNegativeAngles) {
    EXPECT_FLOAT_EQ(Geometry::WrapDegrees(-90.0f), 270.0f);
    EXPECT_FLOAT_EQ(Geometry::WrapDegrees(720.0f), 0.0f);
}

TEST(GeometryTests, DirectionFromAngle) {
    glm::vec2 right = Geometry::DirectionFromAngle(0.0f);
    EXPECT_NEAR(right.x, 1.0f, 1e-6f);
    EXPECT_NEAR(right.y, 0.0f, 1e-6f);

    glm::vec2 down = Geometry::DirectionFromAngle(glm::half_pi<float>());
    EXPECT_NEAR(down.x, 0.0f, 1e-6f);
    EXPECT_NEAR(down.y, 1.0f, 1e-6f);
}

TEST(GeometryTests, PerpendicularRotatesCounterClockwise) {
    glm::vec2 p = Geometry::Perpendicular(glm::vec2(1.0f, 0.0f));
    EXPECT_FLOAT_EQ(p.x, 0.0f);
    EXPECT_FLOAT_EQ(p.y, 1.0f);

    glm::vec2 q = Geometry::Perpendicular(glm::vec2(3.0f, 4.0f));
    EXPECT_FLOAT_EQ(q.x, -4.0f);
    EXPECT_FLOAT_EQ(q.y, 3.0f);
}

TEST(GeometryTests, CirclesOverlapIsStrict) {
    EXPECT_FALSE(CollisionHelpers::CirclesOverlap(glm::vec2(0.0f), 5.0f, glm::vec2(10.0f, 0.0f), 5.0f));
    EXPECT_TRUE(CollisionHelpers::CirclesOverlap(glm::vec2(0.0f), 5.0f, glm::vec2(9.9f, 0.0f), 5.0f));
}

TEST(GeometryTests, CirclesOverlapIgnoresWrapAround) {
    // Opposite edges of the playfield are far apart in raw distance
    EXPECT_FALSE(CollisionHelpers::CirclesOverlap(glm::vec2(1.0f, 500.0f), 10.0f, glm::vec2(1279.0f, 500.0f), 10.0f));
}

TEST(GeometryTests, PointInCircle) {
    EXPECT_TRUE(CollisionHelpers::PointInCircle(glm::vec2(3.0f, 4.0f), glm::vec2(0.0f), 5.1f));
    EXPECT_FALSE(CollisionHelpers::PointInCircle(glm::vec2(3.0f, 4.0f), glm::vec2(0.0f), 5.0f));
}
