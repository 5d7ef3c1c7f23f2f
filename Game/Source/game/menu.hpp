#ifndef MAIN_MENU_GAME
#define MAIN_MENU_GAME

#include "OpenAL/AudioChannels.hpp"
#include <functional>
#include <string>

class GameSession;

enum class MenuItem {
    MUSIC_VOLUME = 0,
    SFX_VOLUME = 1
};

enum class MenuKey {
    UP,
    DOWN,
    LEFT,
    RIGHT,
    CONFIRM
};

// Volume settings shown before a game starts. Up/Down move the selection
// with wrap-around, Left/Right step the selected volume.
class MainMenu {
public:
    static constexpr int ITEM_COUNT = 2;
    static constexpr float VOLUME_STEP = 0.05f;

    using VolumeChangedCallback = std::function<void(AudioChannel channel, float volume)>;

    explicit MainMenu(AudioChannelManager& channels) : channels(channels) {}

    // Called with the new channel volume whenever an item changes.
    void SetOnVolumeChanged(VolumeChangedCallback callback) { onVolumeChanged = std::move(callback); }

    void SelectNext();
    void SelectPrevious();
    void IncreaseSelected();
    void DecreaseSelected();

    MenuItem Selected() const { return selected; }
    float Volume(MenuItem item) const;
    std::string Describe() const;

    static AudioChannel ChannelFor(MenuItem item);

private:
    void StepSelected(float delta);

    AudioChannelManager& channels;
    MenuItem selected = MenuItem::MUSIC_VOLUME;
    VolumeChangedCallback onVolumeChanged;
};

// Routes one tapped key by phase. The menu navigates, adjusts volumes and
// starts on CONFIRM; GameOver only restarts on CONFIRM; Playing ignores keys.
void ApplyMenuKey(GameSession& session, MainMenu& menu, MenuKey key);

#endif
