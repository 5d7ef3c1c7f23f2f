#include "GameSession.hpp"
#include "Components.hpp"
#include "EntityFactory.hpp"
#include "Events.hpp"
#include "LogicSystems.hpp"
#include "Utils/Debug/Debug.hpp"

#include <algorithm>

GameSession::GameSession(const GameConfig& config, const SessionAssets& assets, IGameAudio& audio, RandomSource rng)
    : config(config)
    , assets(assets)
    , audio(audio)
    , rng(rng)
    , resolver(this->config, this->rng, audio)
    , waveDirector(this->config, this->assets, this->rng)
{
    state.lives = config.wave.startingLives;

    EntityManager& entityManager = world.GetEntityManager();
    EntityFactory::RegisterGameComponents(entityManager);
    craftEntity = EntityFactory::CreateCraft(entityManager, this->config, this->assets.craft);

    world.AddSystem(std::make_unique<CraftControlSystem>(this->rng, audio));
    world.AddSystem(std::make_unique<ProjectileSystem>());
    world.AddSystem(std::make_unique<RockSystem>());
    world.AddSystem(std::make_unique<CollisionResolverSystem>(resolver));
    world.AddSystem(std::make_unique<PruneSystem>());
    world.AddSystem(std::make_unique<DestroyingSystem>());
}

void GameSession::Start() {
    if (state.phase == GamePhase::Playing) {
        Debug::Warning("Session") << "Start requested while playing, ignored";
        return;
    }

    ClearField();

    state.score = 0;
    state.lives = config.wave.startingLives;
    state.waveNumber = 0;
    state.phase = GamePhase::Playing;
    elapsed = 0.0f;

    EntityManager& entityManager = world.GetEntityManager();
    entityManager.GetComponent<Craft>(craftEntity)->Reset(*entityManager.GetComponent<Transform2D>(craftEntity));
    entityManager.GetComponent<Playable>(craftEntity)->input = INPUT_NONE;

    Debug::Info("Session") << "Game started";
    SpawnNextWave();
}

void GameSession::Update(float deltaTime, CraftInput input) {
    if (state.phase != GamePhase::Playing) return;

    elapsed += deltaTime;
    world.GetEntityManager().GetComponent<Playable>(craftEntity)->input = input;

    world.Update(deltaTime);
    ApplyEvents();

    if (state.phase == GamePhase::Playing && RockCount() == 0) {
        SpawnNextWave();
    }
}

void GameSession::ApplyEvents() {
    for (const EventEntry& event : world.GetEvents()) {
        switch (event.type) {
        case EVENT_ROCK_DESTROYED:
            state.score += event.value;
            break;
        case EVENT_CRAFT_DESTROYED:
            OnCraftDestroyed();
            break;
        default:
            Debug::Warning("Session") << "Unhandled event type " << static_cast<int>(event.type);
            break;
        }
    }
    world.ClearEvents();
}

void GameSession::OnCraftDestroyed() {
    EntityManager& entityManager = world.GetEntityManager();
    Craft* craft = entityManager.GetComponent<Craft>(craftEntity);
    Transform2D* transform = entityManager.GetComponent<Transform2D>(craftEntity);

    state.lives -= 1;
    audio.PlayDeathSound();

    if (state.lives < 0) {
        craft->alive = false;
        craft->isThrusting = false;
        state.phase = GamePhase::GameOver;
        Debug::Info("Session") << "Game over with score " << state.score << " on wave " << state.waveNumber;
        return;
    }

    craft->Reset(*transform);
    Debug::Info("Session") << "Craft destroyed, " << state.lives << " lives left";
}

void GameSession::SpawnNextWave() {
    state.waveNumber += 1;
    const Transform2D* craftTransform = world.GetEntityManager().GetComponent<Transform2D>(craftEntity);
    waveDirector.SpawnWave(world.GetEntityManager(), state.waveNumber, craftTransform->getPosition());
}

void GameSession::ClearField() {
    EntityManager& entityManager = world.GetEntityManager();

    auto projectiles = entityManager.CreateQuery<Projectile>();
    for (auto [entity, projectile] : projectiles) {
        entityManager.DestroyEntity(entity);
    }

    auto rocks = entityManager.CreateQuery<RockBody>();
    for (auto [entity, rock] : rocks) {
        entityManager.DestroyEntity(entity);
    }

    entityManager.FlushDestroyedEntities();
    world.ClearEvents();
}

size_t GameSession::RockCount() {
    return world.GetEntityManager().CreateQuery<RockBody>().Count();
}

size_t GameSession::ProjectileCount() {
    return world.GetEntityManager().CreateQuery<Projectile>().Count();
}

GameSnapshot GameSession::Snapshot() {
    GameSnapshot snapshot;
    EntityManager& entityManager = world.GetEntityManager();

    snapshot.playfield = config.playfield.Size();
    snapshot.craftSprite = assets.craft;
    snapshot.score = state.score;
    snapshot.lives = std::max(0, state.lives);
    snapshot.wave = state.waveNumber;
    snapshot.phase = state.phase;

    auto projectiles = entityManager.CreateQuery<Transform2D, Projectile>();
    for (auto [entity, transform, projectile] : projectiles) {
        if (!projectile->alive) continue;
        ProjectileView view;
        view.position = transform->getPosition();
        snapshot.projectiles.push_back(view);
    }

    auto rocks = entityManager.CreateQuery<Transform2D, RockBody>();
    for (auto [entity, transform, rock] : rocks) {
        if (!rock->alive) continue;
        RockView view;
        view.position = transform->getPosition();
        view.rotation = transform->getRotation();
        view.scale = transform->getScale();
        view.radius = rock->collisionRadius;
        view.variant = rock->variant;
        view.sprite = rock->sprite;
        snapshot.rocks.push_back(view);
    }

    const Craft* craft = entityManager.GetComponent<Craft>(craftEntity);
    const Transform2D* transform = entityManager.GetComponent<Transform2D>(craftEntity);
    CraftView& view = snapshot.craft;
    view.position = transform->getPosition();
    view.facing = transform->getRotation();
    view.radius = craft->collisionRadius;
    view.alive = craft->alive;
    view.thrusting = craft->isThrusting;
    view.invulnerable = craft->IsInvulnerable();
    view.visible = craft->alive && craft->IsVisible(elapsed);
    view.nose = craft->NosePosition(*transform);
    view.tail = craft->TailPosition(*transform);
    view.flame = craft->ThrustFlame(*transform);

    return snapshot;
}
