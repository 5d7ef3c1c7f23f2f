#include <gtest/gtest.h>

#include "game/menu.hpp"
#include "game/GameSession.hpp"
#include "TestHelpers.hpp"

#include <vector>

class MenuTests : public ::testing::Test {
protected:
    void SetUp() override {
        channels.SetVolume(AudioChannel::MUSIC, 0.6f);
        channels.SetVolume(AudioChannel::SFX, 0.9f);
    }

    AudioChannelManager channels;
};

TEST_F(MenuTests, SelectionWrapsBothWays) {
    MainMenu menu(channels);
    EXPECT_EQ(menu.Selected(), MenuItem::MUSIC_VOLUME);

    menu.SelectNext();
    EXPECT_EQ(menu.Selected(), MenuItem::SFX_VOLUME);
    menu.SelectNext();
    EXPECT_EQ(menu.Selected(), MenuItem::MUSIC_VOLUME);

    menu.SelectPrevious();
    EXPECT_EQ(menu.Selected(), MenuItem::SFX_VOLUME);
}

TEST_F(MenuTests, StepsTheSelectedVolumeOnly) {
    MainMenu menu(channels);

    menu.IncreaseSelected();
    EXPECT_NEAR(menu.Volume(MenuItem::MUSIC_VOLUME), 0.65f, 1e-5f);
    EXPECT_NEAR(menu.Volume(MenuItem::SFX_VOLUME), 0.9f, 1e-5f);

    menu.SelectNext();
    menu.DecreaseSelected();
    menu.DecreaseSelected();
    EXPECT_NEAR(menu.Volume(MenuItem::SFX_VOLUME), 0.8f, 1e-5f);
    EXPECT_NEAR(channels.GetChannelVolume(AudioChannel::SFX), 0.8f, 1e-5f);
}

TEST_F(MenuTests, VolumesClampToTheUnitRange) {
    MainMenu menu(channels);

    for (int i = 0; i < 30; ++i) menu.IncreaseSelected();
    EXPECT_FLOAT_EQ(menu.Volume(MenuItem::MUSIC_VOLUME), 1.0f);

    for (int i = 0; i < 30; ++i) menu.DecreaseSelected();
    EXPECT_FLOAT_EQ(menu.Volume(MenuItem::MUSIC_VOLUME), 0.0f);
}

TEST_F(MenuTests, NotifiesWithTheEffectiveVolume) {
    channels.SetVolume(AudioChannel::MASTER, 0.5f);
    MainMenu menu(channels);

    std::vector<std::pair<AudioChannel, float>> calls;
    menu.SetOnVolumeChanged([&](AudioChannel channel, float volume) {
        calls.emplace_back(channel, volume);
    });

    menu.SelectNext();
    menu.IncreaseSelected();

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].first, AudioChannel::SFX);
    EXPECT_NEAR(calls[0].second, 0.475f, 1e-5f);
}

TEST_F(MenuTests, DescribeMarksTheSelection) {
    MainMenu menu(channels);
    EXPECT_EQ(menu.Describe(), "> Music 60%    SFX 90%");

    menu.SelectNext();
    EXPECT_EQ(menu.Describe(), "  Music 60%  > SFX 90%");
}

TEST_F(MenuTests, ItemsMapToChannels) {
    EXPECT_EQ(MainMenu::ChannelFor(MenuItem::MUSIC_VOLUME), AudioChannel::MUSIC);
    EXPECT_EQ(MainMenu::ChannelFor(MenuItem::SFX_VOLUME), AudioChannel::SFX);
}

class MenuKeyTests : public ::testing::Test {
protected:
    MenuKeyTests() {
        channels.SetVolume(AudioChannel::MUSIC, 0.6f);
        channels.SetVolume(AudioChannel::SFX, 0.9f);
        assets.rocks.push_back(SpriteSize(128.0f, 128.0f));
    }

    void LoseEveryLife() {
        EntityManager& world = session.GetEntityManager();
        SpawnRock(world, config, MakeRockSpawn(config.playfield.Center()));
        for (int i = 0; i < 4; ++i) {
            world.GetComponent<Craft>(session.GetCraftEntity())->invulnerabilityRemaining = 0.0f;
            session.Update(0.001f, INPUT_NONE);
        }
    }

    GameConfig config = GameConfig::Default();
    SessionAssets assets;
    CountingAudio audio;
    AudioChannelManager channels;
    MainMenu menu{channels};
    GameSession session{config, assets, audio, RandomSource(3)};
};

TEST_F(MenuKeyTests, MenuKeysNavigateAdjustAndStart) {
    ApplyMenuKey(session, menu, MenuKey::DOWN);
    EXPECT_EQ(menu.Selected(), MenuItem::SFX_VOLUME);
    ApplyMenuKey(session, menu, MenuKey::LEFT);
    EXPECT_NEAR(channels.GetChannelVolume(AudioChannel::SFX), 0.85f, 1e-5f);
    ApplyMenuKey(session, menu, MenuKey::UP);
    ApplyMenuKey(session, menu, MenuKey::RIGHT);
    EXPECT_NEAR(channels.GetChannelVolume(AudioChannel::MUSIC), 0.65f, 1e-5f);

    ApplyMenuKey(session, menu, MenuKey::CONFIRM);
    EXPECT_EQ(session.Phase(), GamePhase::Playing);
}

TEST_F(MenuKeyTests, PlayingIgnoresMenuKeys) {
    ApplyMenuKey(session, menu, MenuKey::CONFIRM);
    ASSERT_EQ(session.Phase(), GamePhase::Playing);

    ApplyMenuKey(session, menu, MenuKey::DOWN);
    ApplyMenuKey(session, menu, MenuKey::RIGHT);
    ApplyMenuKey(session, menu, MenuKey::CONFIRM);

    EXPECT_EQ(menu.Selected(), MenuItem::MUSIC_VOLUME);
    EXPECT_NEAR(channels.GetChannelVolume(AudioChannel::MUSIC), 0.6f, 1e-5f);
    EXPECT_EQ(session.State().waveNumber, 1);
}

TEST_F(MenuKeyTests, GameOverOnlyReactsToConfirm) {
    session.Start();
    LoseEveryLife();
    ASSERT_EQ(session.Phase(), GamePhase::GameOver);

    ApplyMenuKey(session, menu, MenuKey::DOWN);
    ApplyMenuKey(session, menu, MenuKey::LEFT);
    ApplyMenuKey(session, menu, MenuKey::RIGHT);
    ApplyMenuKey(session, menu, MenuKey::UP);

    EXPECT_EQ(session.Phase(), GamePhase::GameOver);
    EXPECT_EQ(menu.Selected(), MenuItem::MUSIC_VOLUME);
    EXPECT_NEAR(channels.GetChannelVolume(AudioChannel::MUSIC), 0.6f, 1e-5f);
    EXPECT_NEAR(channels.GetChannelVolume(AudioChannel::SFX), 0.9f, 1e-5f);

    ApplyMenuKey(session, menu, MenuKey::CONFIRM);
    EXPECT_EQ(session.Phase(), GamePhase::Playing);
    EXPECT_EQ(session.State().lives, 3);
    EXPECT_EQ(session.State().score, 0);
}
