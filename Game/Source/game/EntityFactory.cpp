#include "EntityFactory.hpp"

namespace EntityFactory {

void RegisterGameComponents(EntityManager& entityManager) {
    entityManager.RegisterComponentType<Transform2D>();
    entityManager.RegisterComponentType<CircleCollider2D>();
    entityManager.RegisterComponentType<Playable>();
    entityManager.RegisterComponentType<Craft>();
    entityManager.RegisterComponentType<Projectile>();
    entityManager.RegisterComponentType<RockBody>();
}

Entity CreateCraft(EntityManager& entityManager, const GameConfig& config, const SpriteSize& sprite) {
    Entity craftEntity = entityManager.CreateEntity();

    Transform2D* transform = entityManager.AddComponent<Transform2D>(craftEntity);
    Craft* craft = entityManager.AddComponent<Craft>(craftEntity, config.craft, config.projectile,
                                                     config.playfield.Size(), sprite);
    craft->Reset(*transform);

    entityManager.AddComponent<CircleCollider2D>(craftEntity, craft->collisionRadius,
                                                 CollisionLayer::PLAYER, CollisionLayer::ROCK);
    entityManager.AddComponent<Playable>(craftEntity);
    return craftEntity;
}

Entity CreateProjectile(EntityManager& entityManager, const ProjectileConfig& config, const glm::vec2& playfield,
                        const glm::vec2& position, const glm::vec2& velocity) {
    Entity projectileEntity = entityManager.CreateEntity();

    entityManager.AddComponent<Transform2D>(projectileEntity, position);
    entityManager.AddComponent<Projectile>(projectileEntity, velocity, config, playfield);
    entityManager.AddComponent<CircleCollider2D>(projectileEntity, config.collisionRadius,
                                                 CollisionLayer::PROJECTILE, CollisionLayer::ROCK);
    return projectileEntity;
}

Entity CreateRock(EntityManager& entityManager, const RockConfig& config, const glm::vec2& playfield,
                  const RockSpawn& spawn) {
    Entity rockEntity = entityManager.CreateEntity();

    entityManager.AddComponent<Transform2D>(rockEntity, spawn.position, spawn.rotation, spawn.scale);
    RockBody* rock = entityManager.AddComponent<RockBody>(rockEntity, spawn, config, playfield);
    entityManager.AddComponent<CircleCollider2D>(rockEntity, rock->collisionRadius,
                                                 CollisionLayer::ROCK, CollisionLayer::PLAYER | CollisionLayer::PROJECTILE);
    return rockEntity;
}

} // namespace EntityFactory
