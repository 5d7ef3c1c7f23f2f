#pragma once

#include "ecs/ecs_common.hpp"
#include "Components.hpp"
#include "GameAudio.hpp"
#include "RandomSource.hpp"
#include "Inputs.hpp"

// Applies the Playable input to the craft: steering and thrust, then
// firing, then hyperspace.
class CraftControlSystem : public ISystem {
public:
    CraftControlSystem(RandomSource& rng, IGameAudio& audio) : rng(rng), audio(audio) {}

    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override {
        auto query = entityManager.CreateQuery<Transform2D, Playable, Craft>();
        for (auto [entity, transform, play, craft] : query) {
            if (!craft->alive) continue;

            CraftInput input = play->input;
            craft->Update(*transform, deltaTime, input);

            if (HasInput(input, INPUT_FIRE)) {
                craft->Fire(*transform, entityManager, audio);
            }
            if (HasInput(input, INPUT_HYPERSPACE)) {
                craft->Hyperspace(*transform, rng);
            }
        }
    }

private:
    RandomSource& rng;
    IGameAudio& audio;
};

class ProjectileSystem : public ISystem {
public:
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override {
        auto query = entityManager.CreateQuery<Transform2D, Projectile>();
        for (auto [entity, transform, projectile] : query) {
            projectile->Update(*transform, deltaTime);
        }
    }
};

class RockSystem : public ISystem {
public:
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override {
        auto query = entityManager.CreateQuery<Transform2D, RockBody>();
        for (auto [entity, transform, rock] : query) {
            rock->Update(*transform, deltaTime);
        }
    }
};

// Queues dead projectiles and rocks for destruction. A DestroyingSystem
// registered after it removes them.
class PruneSystem : public ISystem {
public:
    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) override {
        auto projectiles = entityManager.CreateQuery<Projectile>();
        for (auto [entity, projectile] : projectiles) {
            if (!projectile->alive) entityManager.DestroyEntity(entity);
        }

        auto rocks = entityManager.CreateQuery<RockBody>();
        for (auto [entity, rock] : rocks) {
            if (!rock->alive) entityManager.DestroyEntity(entity);
        }
    }
};
