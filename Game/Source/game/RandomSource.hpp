#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include "Utils/Geometry.hpp"
#include <cstdint>
#include <random>

// Single pseudo-random stream shared by everything in a session.
class RandomSource {
public:
    RandomSource() : rng_(std::random_device{}()) {}
    explicit RandomSource(uint32_t seed) : rng_(seed) {}

    // Uniform in [lo, hi).
    float Uniform(float lo, float hi) {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(rng_);
    }

    // Uniform in [lo, hi], both ends included.
    int UniformInt(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng_);
    }

    float AngleRadians() {
        return Uniform(0.0f, glm::two_pi<float>());
    }

    // float distributions can round up to the upper bound, so results that
    // must stay half-open are wrapped back in.
    float AngleDegrees() {
        return Geometry::WrapDegrees(Uniform(0.0f, 360.0f));
    }

    glm::vec2 PointIn(const glm::vec2& size) {
        return Geometry::Wrap(glm::vec2(Uniform(0.0f, size.x), Uniform(0.0f, size.y)), size);
    }

private:
    std::mt19937 rng_;
};
