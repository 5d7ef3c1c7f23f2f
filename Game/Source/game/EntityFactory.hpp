#pragma once

#include "ecs/ecs_common.hpp"
#include "ecs/Collisions/CircleCollider2D.hpp"
#include "Components.hpp"

// Builders for the three entity kinds. Every entity gets a Transform2D and a
// CircleCollider2D next to its gameplay component.
namespace EntityFactory {

void RegisterGameComponents(EntityManager& entityManager);

Entity CreateCraft(EntityManager& entityManager, const GameConfig& config, const SpriteSize& sprite);

Entity CreateProjectile(EntityManager& entityManager, const ProjectileConfig& config, const glm::vec2& playfield,
                        const glm::vec2& position, const glm::vec2& velocity);

Entity CreateRock(EntityManager& entityManager, const RockConfig& config, const glm::vec2& playfield,
                  const RockSpawn& spawn);

} // namespace EntityFactory
