#pragma once

#include "game/Components.hpp"
#include "game/EntityFactory.hpp"
#include "game/GameAudio.hpp"
#include "game/GameConfig.hpp"

struct CountingAudio : public IGameAudio {
    int shots = 0;
    int explosions = 0;
    int deaths = 0;

    void PlayShootSound() override { shots++; }
    void PlayExplosionSound() override { explosions++; }
    void PlayDeathSound() override { deaths++; }
};

inline RockSpawn MakeRockSpawn(const glm::vec2& position, float scale = 1.0f,
                               const glm::vec2& velocity = glm::vec2(0.0f),
                               SpriteSize sprite = SpriteSize(128.0f, 128.0f)) {
    RockSpawn spawn;
    spawn.position = position;
    spawn.velocity = velocity;
    spawn.scale = scale;
    spawn.sprite = sprite;
    return spawn;
}

inline Entity SpawnRock(EntityManager& entityManager, const GameConfig& config, const RockSpawn& spawn) {
    return EntityFactory::CreateRock(entityManager, config.rock, config.playfield.Size(), spawn);
}

inline Entity SpawnProjectile(EntityManager& entityManager, const GameConfig& config, const glm::vec2& position,
                              const glm::vec2& velocity = glm::vec2(0.0f)) {
    return EntityFactory::CreateProjectile(entityManager, config.projectile, config.playfield.Size(), position, velocity);
}
