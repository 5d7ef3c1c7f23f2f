#include "WaveDirector.hpp"
#include "Components.hpp"
#include "EntityFactory.hpp"
#include "RandomSource.hpp"
#include "ecs/Collisions/CollisionHelpers.hpp"
#include "Utils/Geometry.hpp"
#include "Utils/Debug/Debug.hpp"

WaveDirector::WaveDirector(const GameConfig& config, const SessionAssets& assets, RandomSource& rng)
    : config(config)
    , assets(assets)
    , rng(rng)
{
    if (this->assets.rocks.empty()) {
        this->assets.rocks.push_back(SessionAssets::PlaceholderRock());
    }
}

int WaveDirector::SpawnWave(EntityManager& entityManager, int waveNumber, const glm::vec2& craftPosition) {
    int count = RockCountFor(waveNumber);
    glm::vec2 playfield = config.playfield.Size();

    for (int i = 0; i < count; ++i) {
        RockSpawn spawn;
        spawn.variant = rng.UniformInt(0, static_cast<int>(assets.rocks.size()) - 1);
        spawn.sprite = assets.rocks[spawn.variant];
        spawn.scale = rng.Uniform(config.wave.minSpawnScale, config.wave.maxSpawnScale);

        float radius = RockBody::RadiusFor(spawn.sprite.width, spawn.scale, config.rock.collisionScale);
        spawn.position = PickSpawnPosition(radius, craftPosition);

        float speed = rng.Uniform(config.rock.minSpeed, config.rock.maxSpeed);
        spawn.velocity = Geometry::DirectionFromAngle(rng.AngleRadians()) * speed;
        spawn.spinRate = rng.Uniform(-config.wave.spawnSpin, config.wave.spawnSpin);
        spawn.rotation = rng.AngleDegrees();

        EntityFactory::CreateRock(entityManager, config.rock, playfield, spawn);
    }

    Debug::Info("Wave") << "Wave " << waveNumber << " spawned with " << count << " rocks";
    return count;
}

glm::vec2 WaveDirector::PickSpawnPosition(float rockRadius, const glm::vec2& craftPosition) {
    glm::vec2 candidate = rng.PointIn(config.playfield.Size());

    for (int attempt = 1; attempt < config.wave.maxPlacementAttempts; ++attempt) {
        if (!CollisionHelpers::CirclesOverlap(candidate, rockRadius, craftPosition, config.wave.clearanceRadius)) {
            return candidate;
        }
        candidate = rng.PointIn(config.playfield.Size());
    }

    if (CollisionHelpers::CirclesOverlap(candidate, rockRadius, craftPosition, config.wave.clearanceRadius)) {
        Debug::Warning("Wave") << "No clear spawn point after " << config.wave.maxPlacementAttempts
                               << " attempts, placing rock near the craft";
    }
    return candidate;
}
