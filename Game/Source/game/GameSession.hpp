#pragma once

#include "ecs/ecs.hpp"
#include "GameConfig.hpp"
#include "GameAudio.hpp"
#include "GameSnapshot.hpp"
#include "SessionAssets.hpp"
#include "RandomSource.hpp"
#include "WaveDirector.hpp"
#include "CollisionResolver.hpp"
#include "Inputs.hpp"

struct SessionState {
    int score = 0;
    int lives = 0;
    int waveNumber = 0;
    GamePhase phase = GamePhase::Menu;
};

// Owns the world and every entity in it and drives the
// Menu -> Playing -> GameOver state machine one frame at a time.
//
// World systems, in order: craft control, projectiles, rocks, collisions,
// pruning, destruction. Events from the frame are then applied to the
// session state and a new wave is spawned when the field is empty.
class GameSession {
public:
    GameSession(const GameConfig& config, const SessionAssets& assets, IGameAudio& audio,
                RandomSource rng = RandomSource());

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    // Menu or GameOver -> Playing with a fresh score, lives and wave 1.
    // Ignored while already Playing.
    void Start();

    // Advances one frame. Does nothing outside Playing.
    void Update(float deltaTime, CraftInput input);

    GameSnapshot Snapshot();

    const SessionState& State() const { return state; }
    GamePhase Phase() const { return state.phase; }
    const GameConfig& Config() const { return config; }

    EntityManager& GetEntityManager() { return world.GetEntityManager(); }
    Entity GetCraftEntity() const { return craftEntity; }
    float ElapsedTime() const { return elapsed; }

    size_t RockCount();
    size_t ProjectileCount();

private:
    void ApplyEvents();
    void OnCraftDestroyed();
    void SpawnNextWave();
    void ClearField();

    GameConfig config;
    SessionAssets assets;
    IGameAudio& audio;
    RandomSource rng;
    CollisionResolver resolver;
    WaveDirector waveDirector;
    ECSWorld world;
    SessionState state;
    Entity craftEntity = NULL_ENTITY;
    float elapsed = 0.0f;
};
