#include "Components.hpp"
#include "RandomSource.hpp"
#include "Utils/Geometry.hpp"

#include <algorithm>
#include <cmath>

RockBody::RockBody(const RockSpawn& spawn, const RockConfig& config, const glm::vec2& playfield)
    : velocity(spawn.velocity)
    , spinRate(spawn.spinRate)
    , collisionRadius(RadiusFor(spawn.sprite.width, spawn.scale, config.collisionScale))
    , variant(spawn.variant)
    , sprite(spawn.sprite)
    , alive(true)
    , config(config)
    , playfieldSize(playfield)
{}

float RockBody::RadiusFor(float spriteWidth, float scale, float collisionScale) {
    // Scaled sprites are whole pixels wide, never narrower than one
    float scaledWidth = std::max(1.0f, std::floor(spriteWidth * scale));
    return 0.5f * scaledWidth * collisionScale;
}

void RockBody::Update(Transform2D& transform, float deltaTime) {
    if (!alive) return;

    transform.setPosition(Geometry::Wrap(transform.getPosition() + velocity * deltaTime, playfieldSize));
    transform.setRotation(Geometry::WrapDegrees(transform.getRotation() + spinRate * deltaTime));
}

std::vector<RockSpawn> RockBody::Fragment(const Transform2D& transform, RandomSource& rng) {
    std::vector<RockSpawn> children;
    alive = false;

    float childScale = transform.getScale() * config.fragmentScaleFactor;
    if (childScale < config.minScale) {
        return children;
    }

    int count = rng.UniformInt(config.minFragments, config.maxFragments);
    children.reserve(count);

    for (int i = 0; i < count; ++i) {
        RockSpawn child;
        child.position = transform.getPosition();

        glm::vec2 kick = Geometry::DirectionFromAngle(rng.AngleRadians()) * rng.Uniform(config.minSpeed, config.maxSpeed);
        child.velocity = velocity + kick;
        child.scale = childScale;
        child.spinRate = rng.Uniform(-config.fragmentSpin, config.fragmentSpin);
        child.rotation = rng.AngleDegrees();
        child.variant = variant;
        child.sprite = sprite;
        children.push_back(child);
    }

    return children;
}
