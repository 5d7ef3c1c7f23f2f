#pragma once

#include "ecs/ecs.hpp"
#include "GameConfig.hpp"
#include "SessionAssets.hpp"

class RandomSource;

// Places the rocks of a new wave, keeping them clear of the craft.
class WaveDirector {
public:
    WaveDirector(const GameConfig& config, const SessionAssets& assets, RandomSource& rng);

    int RockCountFor(int waveNumber) const { return config.wave.baseRockCount + waveNumber; }

    // Spawns the rocks of the given (already incremented) wave number and
    // returns how many were created.
    int SpawnWave(EntityManager& entityManager, int waveNumber, const glm::vec2& craftPosition);

    // Rejection-samples a position whose rock circle stays outside the
    // clearance circle around the craft. After the attempt budget runs out
    // the last sample is used.
    glm::vec2 PickSpawnPosition(float rockRadius, const glm::vec2& craftPosition);

private:
    GameConfig config;
    SessionAssets assets;
    RandomSource& rng;
};
