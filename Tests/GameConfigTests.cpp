#include <gtest/gtest.h>

#include "game/GameConfig.hpp"

#include <stdexcept>

TEST(GameConfigTests, DefaultsMatchTheTuning) {
    GameConfig config = GameConfig::Default();

    EXPECT_FLOAT_EQ(config.playfield.width, 1280.0f);
    EXPECT_FLOAT_EQ(config.playfield.height, 1024.0f);
    EXPECT_FLOAT_EQ(config.projectile.speed, 520.0f);
    EXPECT_FLOAT_EQ(config.projectile.lifetime, 1.2f);
    EXPECT_EQ(config.projectile.maxConcurrent, 5);
    EXPECT_EQ(config.rock.minFragments, 2);
    EXPECT_EQ(config.rock.maxFragments, 3);
    EXPECT_FLOAT_EQ(config.rock.fragmentScaleFactor, 0.6f);
    EXPECT_FLOAT_EQ(config.rock.minScale, 0.45f);
    EXPECT_FLOAT_EQ(config.craft.turnRate, 220.0f);
    EXPECT_FLOAT_EQ(config.craft.fireCooldown, 0.18f);
    EXPECT_EQ(config.wave.baseRockCount, 3);
    EXPECT_EQ(config.wave.startingLives, 3);
    EXPECT_FLOAT_EQ(config.wave.clearanceRadius, 140.0f);
}

TEST(GameConfigTests, NoArgumentsGiveDefaults) {
    LaunchOptions options = ParseLaunchOptions({});

    EXPECT_EQ(options.assetsDir, "assets");
    EXPECT_EQ(options.fpsCap, 0);
    EXPECT_FLOAT_EQ(options.musicVolume, 0.6f);
    EXPECT_FLOAT_EQ(options.sfxVolume, 0.9f);
    EXPECT_TRUE(options.consoleLog);
    EXPECT_FALSE(options.showHelp);
}

TEST(GameConfigTests, ParsesEveryFlag) {
    LaunchOptions options = ParseLaunchOptions({
        "--width", "800", "--height", "600", "--assets", "data",
        "--fps", "60", "--music-volume", "0.25", "--sfx-volume", "1",
        "--no-console-log", "--help"
    });

    EXPECT_FLOAT_EQ(options.game.playfield.width, 800.0f);
    EXPECT_FLOAT_EQ(options.game.playfield.height, 600.0f);
    EXPECT_EQ(options.assetsDir, "data");
    EXPECT_EQ(options.fpsCap, 60);
    EXPECT_FLOAT_EQ(options.musicVolume, 0.25f);
    EXPECT_FLOAT_EQ(options.sfxVolume, 1.0f);
    EXPECT_FALSE(options.consoleLog);
    EXPECT_TRUE(options.showHelp);
}

TEST(GameConfigTests, RejectsBadArguments) {
    EXPECT_THROW((ParseLaunchOptions({ "--bogus" })), std::invalid_argument);
    EXPECT_THROW((ParseLaunchOptions({ "--width" })), std::invalid_argument);
    EXPECT_THROW((ParseLaunchOptions({ "--width", "wide" })), std::invalid_argument);
    EXPECT_THROW((ParseLaunchOptions({ "--width", "0" })), std::invalid_argument);
    EXPECT_THROW((ParseLaunchOptions({ "--height", "12px" })), std::invalid_argument);
    EXPECT_THROW((ParseLaunchOptions({ "--fps", "-1" })), std::invalid_argument);
    EXPECT_THROW((ParseLaunchOptions({ "--music-volume", "1.5" })), std::invalid_argument);
    EXPECT_THROW((ParseLaunchOptions({ "--sfx-volume", "-0.1" })), std::invalid_argument);
}
