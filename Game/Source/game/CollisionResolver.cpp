#include "CollisionResolver.hpp"
#include "Components.hpp"
#include "EntityFactory.hpp"
#include "Events.hpp"
#include "GameAudio.hpp"
#include "RandomSource.hpp"

#include <algorithm>
#include <cmath>

void CollisionResolver::Resolve(EntityManager& entityManager, std::vector<EventEntry>& events) {
    ResolveProjectileHits(entityManager, events);
    ResolveCraftHit(entityManager, events);
}

int CollisionResolver::ScoreFor(float rockCollisionRadius) const {
    return std::max(config.rock.minScoreValue, static_cast<int>(std::floor(rockCollisionRadius)));
}

int CollisionResolver::ResolveProjectileHits(EntityManager& entityManager, std::vector<EventEntry>& events) {
    int destroyed = 0;

    // Both queries are fixed at their first iteration: fragments spawned
    // here are not tested against projectiles until the next frame.
    auto rocks = entityManager.CreateQuery<Transform2D, CircleCollider2D, RockBody>();
    auto projectiles = entityManager.CreateQuery<Transform2D, CircleCollider2D, Projectile>();

    for (auto [rockEntity, rockTransform, rockCollider, rock] : rocks) {
        if (!rock->alive) continue;

        for (auto [projectileEntity, projectileTransform, projectileCollider, projectile] : projectiles) {
            if (!projectile->alive) continue;
            if (!projectileCollider->Overlaps(*projectileTransform, *rockCollider, *rockTransform)) continue;

            projectile->alive = false;

            int gained = ScoreFor(rock->collisionRadius);
            glm::vec2 center = rockTransform->getPosition();

            std::vector<RockSpawn> fragments = rock->Fragment(*rockTransform, rng);
            for (const RockSpawn& fragment : fragments) {
                EntityFactory::CreateRock(entityManager, config.rock, config.playfield.Size(), fragment);
            }

            audio.PlayExplosionSound();
            events.push_back(MakeEvent(EVENT_ROCK_DESTROYED, gained, center));
            destroyed++;
            break;
        }
    }

    return destroyed;
}

bool CollisionResolver::ResolveCraftHit(EntityManager& entityManager, std::vector<EventEntry>& events) {
    auto crafts = entityManager.CreateQuery<Transform2D, CircleCollider2D, Craft>();

    for (auto [craftEntity, craftTransform, craftCollider, craft] : crafts) {
        if (!craft->alive || craft->IsInvulnerable()) continue;

        // Fresh query so fragments from this frame are included
        auto rocks = entityManager.CreateQuery<Transform2D, CircleCollider2D, RockBody>();
        for (auto [rockEntity, rockTransform, rockCollider, rock] : rocks) {
            if (!rock->alive) continue;
            if (craftCollider->Overlaps(*craftTransform, *rockCollider, *rockTransform)) {
                events.push_back(MakeEvent(EVENT_CRAFT_DESTROYED, 0, craftTransform->getPosition()));
                return true;
            }
        }
    }

    return false;
}
