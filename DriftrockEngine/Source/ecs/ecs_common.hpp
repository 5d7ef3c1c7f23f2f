#ifndef ECS_COMMON_H
#define ECS_COMMON_H

#include "ecs.hpp"
#include <glm/glm.hpp>
#include <cstdint>

// Position in playfield pixels, rotation in degrees around the screen normal,
// uniform scale.
class Transform2D : public IComponent {
public:
    Transform2D()
        : position(0.0f, 0.0f)
        , rotation(0.0f)
        , scale(1.0f)
    {}

    Transform2D(const glm::vec2& pos, float rot = 0.0f, float scl = 1.0f)
        : position(pos)
        , rotation(rot)
        , scale(scl)
    {}

    void setPosition(const glm::vec2& pos) { position = pos; }

    const glm::vec2& getPosition() const { return position; }

    void setRotation(float degrees) { rotation = degrees; }

    float getRotation() const { return rotation; }

    float getScale() const { return scale; }

private:
    glm::vec2 position;
    float rotation;
    float scale;
};

// Marks the entity driven by the local player. The input mask is written by
// the owner of the world once per frame and read by the control system.
class Playable : public IComponent {
public:
    uint8_t input;

    Playable() : input(0) {}
    explicit Playable(uint8_t in) : input(in) {}
};

#endif // ECS_COMMON_H
