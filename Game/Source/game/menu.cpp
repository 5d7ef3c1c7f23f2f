#include "menu.hpp"
#include "GameSession.hpp"

#include <cmath>
#include <sstream>

AudioChannel MainMenu::ChannelFor(MenuItem item) {
    return item == MenuItem::MUSIC_VOLUME ? AudioChannel::MUSIC : AudioChannel::SFX;
}

void MainMenu::SelectNext() {
    int index = (static_cast<int>(selected) + 1) % ITEM_COUNT;
    selected = static_cast<MenuItem>(index);
}

void MainMenu::SelectPrevious() {
    int index = (static_cast<int>(selected) + ITEM_COUNT - 1) % ITEM_COUNT;
    selected = static_cast<MenuItem>(index);
}

void MainMenu::IncreaseSelected() {
    StepSelected(VOLUME_STEP);
}

void MainMenu::DecreaseSelected() {
    StepSelected(-VOLUME_STEP);
}

float MainMenu::Volume(MenuItem item) const {
    return channels.GetChannelVolume(ChannelFor(item));
}

void MainMenu::StepSelected(float delta) {
    AudioChannel channel = ChannelFor(selected);
    // SetVolume clamps to [0, 1]
    channels.SetVolume(channel, channels.GetChannelVolume(channel) + delta);

    if (onVolumeChanged) {
        onVolumeChanged(channel, channels.GetVolume(channel));
    }
}

std::string MainMenu::Describe() const {
    std::ostringstream out;
    const char* names[ITEM_COUNT] = { "Music", "SFX" };
    for (int i = 0; i < ITEM_COUNT; ++i) {
        MenuItem item = static_cast<MenuItem>(i);
        if (i > 0) out << "  ";
        out << (item == selected ? "> " : "  ") << names[i] << " "
            << static_cast<int>(std::lround(Volume(item) * 100.0f)) << "%";
    }
    return out.str();
}

void ApplyMenuKey(GameSession& session, MainMenu& menu, MenuKey key) {
    switch (session.Phase()) {
    case GamePhase::Playing:
        return;
    case GamePhase::GameOver:
        if (key == MenuKey::CONFIRM) session.Start();
        return;
    case GamePhase::Menu:
        break;
    }

    switch (key) {
    case MenuKey::UP:      menu.SelectPrevious(); break;
    case MenuKey::DOWN:    menu.SelectNext(); break;
    case MenuKey::LEFT:    menu.DecreaseSelected(); break;
    case MenuKey::RIGHT:   menu.IncreaseSelected(); break;
    case MenuKey::CONFIRM: session.Start(); break;
    }
}
