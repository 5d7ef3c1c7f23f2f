#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include <glm/glm.hpp>
#include <cmath>

namespace Geometry {

// True modulo into [0, size). std::fmod keeps the sign of the dividend, so
// negative results are shifted up by one period.
inline float WrapScalar(float value, float size) {
    float r = std::fmod(value, size);
    if (r < 0.0f) r += size;
    // -epsilon + size can round to exactly size
    if (r >= size) r = 0.0f;
    return r;
}

// Toroidal wrap of a playfield position, each axis independently.
inline glm::vec2 Wrap(const glm::vec2& position, const glm::vec2& playfieldSize) {
    return glm::vec2(WrapScalar(position.x, playfieldSize.x),
                     WrapScalar(position.y, playfieldSize.y));
}

inline float WrapDegrees(float degrees) {
    return WrapScalar(degrees, 360.0f);
}

// Unit vector for an angle in radians.
inline glm::vec2 DirectionFromAngle(float radians) {
    return glm::vec2(std::cos(radians), std::sin(radians));
}

// 90 degrees counter-clockwise.
inline glm::vec2 Perpendicular(const glm::vec2& v) {
    return glm::vec2(-v.y, v.x);
}

} // namespace Geometry

#endif // GEOMETRY_HPP
