#pragma once

#include "ecs/ecs.hpp"
#include "GameConfig.hpp"

class RandomSource;
class IGameAudio;

// Resolves projectile/rock and craft/rock contacts once per frame, after
// every entity has moved. Results are reported as world events:
// EVENT_ROCK_DESTROYED per destroyed rock, EVENT_CRAFT_DESTROYED at most once.
class CollisionResolver {
public:
    CollisionResolver(const GameConfig& config, RandomSource& rng, IGameAudio& audio)
        : config(config), rng(rng), audio(audio) {}

    void Resolve(EntityManager& entityManager, std::vector<EventEntry>& events);

    // Returns the number of rocks destroyed.
    int ResolveProjectileHits(EntityManager& entityManager, std::vector<EventEntry>& events);

    // Returns true when the craft was hit.
    bool ResolveCraftHit(EntityManager& entityManager, std::vector<EventEntry>& events);

    int ScoreFor(float rockCollisionRadius) const;

private:
    GameConfig config;
    RandomSource& rng;
    IGameAudio& audio;
};

class CollisionResolverSystem : public ISystem {
public:
    explicit CollisionResolverSystem(CollisionResolver& resolver) : resolver(resolver) {}

    void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float) override {
        resolver.Resolve(entityManager, events);
    }

private:
    CollisionResolver& resolver;
};
