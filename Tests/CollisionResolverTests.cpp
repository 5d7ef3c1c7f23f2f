#include <gtest/gtest.h>

#include "game/CollisionResolver.hpp"
#include "game/Events.hpp"
#include "game/RandomSource.hpp"
#include "TestHelpers.hpp"

class CollisionResolverTests : public ::testing::Test {
protected:
    void SetUp() override {
        EntityFactory::RegisterGameComponents(em);
        craftEntity = EntityFactory::CreateCraft(em, config, SpriteSize(56.0f, 56.0f));
        craft = em.GetComponent<Craft>(craftEntity);
        craftTransform = em.GetComponent<Transform2D>(craftEntity);
        // Park the craft in a corner, vulnerable
        craftTransform->setPosition(glm::vec2(40.0f, 40.0f));
        craft->invulnerabilityRemaining = 0.0f;
    }

    size_t CountEvents(uint8_t type) const {
        size_t count = 0;
        for (const EventEntry& event : events) {
            if (event.type == type) count++;
        }
        return count;
    }

    size_t AliveRocks() {
        size_t count = 0;
        auto rocks = em.CreateQuery<RockBody>();
        for (auto [entity, rock] : rocks) {
            if (rock->alive) count++;
        }
        return count;
    }

    GameConfig config = GameConfig::Default();
    EntityManager em;
    RandomSource rng{11};
    CountingAudio audio;
    CollisionResolver resolver{config, rng, audio};
    std::vector<EventEntry> events;
    Entity craftEntity = NULL_ENTITY;
    Craft* craft = nullptr;
    Transform2D* craftTransform = nullptr;
};

TEST_F(CollisionResolverTests, ScoreIsTheFlooredRadiusWithAMinimum) {
    EXPECT_EQ(resolver.ScoreFor(54.4f), 54);
    EXPECT_EQ(resolver.ScoreFor(32.3f), 32);
    EXPECT_EQ(resolver.ScoreFor(9.9f), 10);
    EXPECT_EQ(resolver.ScoreFor(0.4f), 10);
}

TEST_F(CollisionResolverTests, ProjectileHitDestroysAndFragmentsTheRock) {
    Entity rockEntity = SpawnRock(em, config, MakeRockSpawn(glm::vec2(600.0f, 500.0f)));
    Entity projectileEntity = SpawnProjectile(em, config, glm::vec2(620.0f, 500.0f));

    EXPECT_EQ(resolver.ResolveProjectileHits(em, events), 1);

    EXPECT_FALSE(em.GetComponent<RockBody>(rockEntity)->alive);
    EXPECT_FALSE(em.GetComponent<Projectile>(projectileEntity)->alive);
    EXPECT_EQ(audio.explosions, 1);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EVENT_ROCK_DESTROYED);
    EXPECT_EQ(events[0].value, 54);
    EXPECT_FLOAT_EQ(events[0].position.x, 600.0f);
    EXPECT_FLOAT_EQ(events[0].position.y, 500.0f);

    size_t fragments = AliveRocks();
    EXPECT_GE(fragments, 2u);
    EXPECT_LE(fragments, 3u);

    auto rocks = em.CreateQuery<Transform2D, RockBody>();
    for (auto [entity, transform, rock] : rocks) {
        if (!rock->alive) continue;
        EXPECT_NEAR(transform->getScale(), 0.6f, 1e-5f);
        EXPECT_FLOAT_EQ(transform->getPosition().x, 600.0f);
    }
}

TEST_F(CollisionResolverTests, SmallRockScoresTheMinimumAndLeavesNoFragments) {
    Entity rockEntity = SpawnRock(em, config, MakeRockSpawn(glm::vec2(600.0f, 500.0f), 0.1f));
    SpawnProjectile(em, config, glm::vec2(600.0f, 500.0f));

    resolver.ResolveProjectileHits(em, events);

    EXPECT_FALSE(em.GetComponent<RockBody>(rockEntity)->alive);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].value, 10);
    EXPECT_EQ(AliveRocks(), 0u);
}

TEST_F(CollisionResolverTests, MissLeavesEverythingAlive) {
    Entity rockEntity = SpawnRock(em, config, MakeRockSpawn(glm::vec2(600.0f, 500.0f)));
    Entity projectileEntity = SpawnProjectile(em, config, glm::vec2(700.0f, 500.0f));

    EXPECT_EQ(resolver.ResolveProjectileHits(em, events), 0);

    EXPECT_TRUE(em.GetComponent<RockBody>(rockEntity)->alive);
    EXPECT_TRUE(em.GetComponent<Projectile>(projectileEntity)->alive);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(audio.explosions, 0);
}

TEST_F(CollisionResolverTests, OneProjectileDestroysAtMostOneRock) {
    Entity first = SpawnRock(em, config, MakeRockSpawn(glm::vec2(600.0f, 500.0f)));
    Entity second = SpawnRock(em, config, MakeRockSpawn(glm::vec2(640.0f, 500.0f)));
    SpawnProjectile(em, config, glm::vec2(620.0f, 500.0f));

    EXPECT_EQ(resolver.ResolveProjectileHits(em, events), 1);

    EXPECT_FALSE(em.GetComponent<RockBody>(first)->alive);
    EXPECT_TRUE(em.GetComponent<RockBody>(second)->alive);
    EXPECT_EQ(CountEvents(EVENT_ROCK_DESTROYED), 1u);
}

TEST_F(CollisionResolverTests, OneRockConsumesOnlyOneProjectile) {
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(600.0f, 500.0f)));
    Entity a = SpawnProjectile(em, config, glm::vec2(590.0f, 500.0f));
    Entity b = SpawnProjectile(em, config, glm::vec2(610.0f, 500.0f));

    EXPECT_EQ(resolver.ResolveProjectileHits(em, events), 1);

    bool aAlive = em.GetComponent<Projectile>(a)->alive;
    bool bAlive = em.GetComponent<Projectile>(b)->alive;
    EXPECT_NE(aAlive, bAlive);
}

TEST_F(CollisionResolverTests, OlderProjectileWinsEvenWithAHigherId) {
    Entity filler = SpawnProjectile(em, config, glm::vec2(1000.0f, 900.0f));
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(600.0f, 500.0f)));
    Entity older = SpawnProjectile(em, config, glm::vec2(600.0f, 500.0f));

    em.DestroyEntity(filler);
    em.FlushDestroyedEntities();

    // Reuses the filler's id, which is lower than the older projectile's
    Entity newer = SpawnProjectile(em, config, glm::vec2(600.0f, 500.0f));
    ASSERT_LT(newer, older);

    EXPECT_EQ(resolver.ResolveProjectileHits(em, events), 1);
    EXPECT_FALSE(em.GetComponent<Projectile>(older)->alive);
    EXPECT_TRUE(em.GetComponent<Projectile>(newer)->alive);
}

TEST_F(CollisionResolverTests, FragmentsAreNotHitInTheFrameTheySpawn) {
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(600.0f, 500.0f)));
    Entity a = SpawnProjectile(em, config, glm::vec2(600.0f, 500.0f));
    Entity b = SpawnProjectile(em, config, glm::vec2(600.0f, 500.0f));

    EXPECT_EQ(resolver.ResolveProjectileHits(em, events), 1);

    // The second projectile sits on top of the fragments and survives
    int survivors = (em.GetComponent<Projectile>(a)->alive ? 1 : 0) +
                    (em.GetComponent<Projectile>(b)->alive ? 1 : 0);
    EXPECT_EQ(survivors, 1);
    EXPECT_GE(AliveRocks(), 2u);

    events.clear();
    EXPECT_EQ(resolver.ResolveProjectileHits(em, events), 1);
}

TEST_F(CollisionResolverTests, CraftHitByRockReportsOnceAndRockSurvives) {
    Entity rockEntity = SpawnRock(em, config, MakeRockSpawn(glm::vec2(60.0f, 40.0f)));
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(40.0f, 60.0f)));

    EXPECT_TRUE(resolver.ResolveCraftHit(em, events));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EVENT_CRAFT_DESTROYED);
    EXPECT_TRUE(em.GetComponent<RockBody>(rockEntity)->alive);
    EXPECT_EQ(AliveRocks(), 2u);
}

TEST_F(CollisionResolverTests, InvulnerableCraftIsNotHit) {
    craft->invulnerabilityRemaining = 0.5f;
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(40.0f, 40.0f)));

    EXPECT_FALSE(resolver.ResolveCraftHit(em, events));
    EXPECT_TRUE(events.empty());
}

TEST_F(CollisionResolverTests, DeadCraftIsNotHit) {
    craft->alive = false;
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(40.0f, 40.0f)));

    EXPECT_FALSE(resolver.ResolveCraftHit(em, events));
}

TEST_F(CollisionResolverTests, FarRockDoesNotHitTheCraft) {
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(400.0f, 400.0f)));
    EXPECT_FALSE(resolver.ResolveCraftHit(em, events));
}

TEST_F(CollisionResolverTests, CraftIsHitByFragmentsSpawnedThisFrame) {
    SpawnRock(em, config, MakeRockSpawn(glm::vec2(50.0f, 40.0f)));
    SpawnProjectile(em, config, glm::vec2(50.0f, 40.0f));

    resolver.Resolve(em, events);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, EVENT_ROCK_DESTROYED);
    EXPECT_EQ(events[1].type, EVENT_CRAFT_DESTROYED);
}
