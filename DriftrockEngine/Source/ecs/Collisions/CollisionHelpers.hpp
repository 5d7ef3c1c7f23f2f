#ifndef COLLISION_HELPERS_HPP
#define COLLISION_HELPERS_HPP

#include <glm/glm.hpp>

namespace CollisionHelpers {

// ==================== Circle Tests ====================
// Raw Euclidean distance: positions on opposite edges of a wrapping
// playfield do not touch.

// Strict: circles that only touch do not overlap.
inline bool CirclesOverlap(const glm::vec2& centerA, float radiusA,
                           const glm::vec2& centerB, float radiusB) {
    glm::vec2 delta = centerA - centerB;
    float radii = radiusA + radiusB;
    return glm::dot(delta, delta) < radii * radii;
}

inline bool PointInCircle(const glm::vec2& point, const glm::vec2& center, float radius) {
    return CirclesOverlap(point, 0.0f, center, radius);
}

} // namespace CollisionHelpers

#endif // COLLISION_HELPERS_HPP
