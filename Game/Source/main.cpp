#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <algorithm>
#include <chrono>
#include <thread>
#include <stdexcept>

#include "OpenGL/OpenGLWindow.hpp"
#include "OpenAL/AudioSystem.hpp"
#include "Utils/AssetManager.hpp"
#include "Utils/Input.hpp"
#include "Utils/Debug/Debug.hpp"

#include "game/GameConfig.hpp"
#include "game/GameSession.hpp"
#include "game/Inputs.hpp"
#include "game/RenderSystems.hpp"
#include "game/SoundBank.hpp"
#include "game/menu.hpp"

namespace {

const float MAX_FRAME_DT = 0.25f;

SpriteSize ToSprite(const glm::ivec2& size) {
    return SpriteSize(static_cast<float>(size.x), static_cast<float>(size.y));
}

SessionAssets LoadSessionAssets(const AssetManager& assets) {
    SessionAssets session;

    SpriteSize craftFallback = SessionAssets::PlaceholderCraft();
    session.craft = ToSprite(assets.imageSizeOr(assets.imagePath("ship.png"),
                                                glm::ivec2(craftFallback.width, craftFallback.height)));

    std::vector<std::string> rockImages = assets.listImages("asteroid", ".png");
    if (rockImages.empty()) {
        rockImages.push_back(assets.imagePath("asteroid1.png"));
    }

    SpriteSize rockFallback = SessionAssets::PlaceholderRock();
    for (const std::string& path : rockImages) {
        session.rocks.push_back(ToSprite(assets.imageSizeOr(path, glm::ivec2(rockFallback.width, rockFallback.height))));
    }

    Debug::Info("Assets") << "Craft sprite " << session.craft.width << "x" << session.craft.height
                          << ", " << session.rocks.size() << " rock variant(s)";
    return session;
}

CraftInput ReadCraftInput() {
    CraftInput m = INPUT_NONE;
    if (Input::KeyPressed(GLFW_KEY_LEFT)) m |= INPUT_TURN_LEFT;
    if (Input::KeyPressed(GLFW_KEY_RIGHT)) m |= INPUT_TURN_RIGHT;
    if (Input::KeyPressed(GLFW_KEY_UP)) m |= INPUT_THRUST;
    if (Input::KeyPressed(GLFW_KEY_SPACE)) m |= INPUT_FIRE;
    if (Input::KeyPressed(GLFW_KEY_H)) m |= INPUT_HYPERSPACE;
    return m;
}

// Menu keys are edge-triggered; gameplay keys are held.
void HandleMenuKeys(GameSession& session, MainMenu& menu, OpenGLWindow& window) {
    if (Input::KeyTapped(GLFW_KEY_ESCAPE) || Input::KeyTapped(GLFW_KEY_Q)) {
        window.close();
        return;
    }

    if (Input::KeyTapped(GLFW_KEY_UP)) ApplyMenuKey(session, menu, MenuKey::UP);
    if (Input::KeyTapped(GLFW_KEY_DOWN)) ApplyMenuKey(session, menu, MenuKey::DOWN);
    if (Input::KeyTapped(GLFW_KEY_LEFT)) ApplyMenuKey(session, menu, MenuKey::LEFT);
    if (Input::KeyTapped(GLFW_KEY_RIGHT)) ApplyMenuKey(session, menu, MenuKey::RIGHT);
    if (Input::KeyTapped(GLFW_KEY_ENTER) || Input::KeyTapped(GLFW_KEY_KP_ENTER)) {
        ApplyMenuKey(session, menu, MenuKey::CONFIRM);
    }
}

int RunGame(const LaunchOptions& options) {
    const GameConfig& config = options.game;
    int width = static_cast<int>(config.playfield.width);
    int height = static_cast<int>(config.playfield.height);

    OpenGLWindow window(width, height, "Driftrock");
    Input::Init(window.getWindow());

    AssetManager assets(options.assetsDir);
    SessionAssets sessionAssets = LoadSessionAssets(assets);

    AudioSystem audio;
    audio.channels.SetVolume(AudioChannel::MUSIC, options.musicVolume);
    audio.channels.SetVolume(AudioChannel::SFX, options.sfxVolume);

    // Declared after the AudioSystem so the effects are released first
    SoundBank sounds(audio.LoadSoundEffect(assets.soundPath("shoot.wav")),
                     audio.LoadSoundEffect(assets.soundPath("explode.wav")),
                     audio.LoadSoundEffect(assets.soundPath("death.wav")));
    sounds.SetVolume(audio.channels.GetVolume(AudioChannel::SFX));
    audio.PlayMusic(assets.soundPath("bg_music.wav"), true);

    MainMenu menu(audio.channels);
    menu.SetOnVolumeChanged([&audio, &sounds](AudioChannel channel, float volume) {
        if (channel == AudioChannel::MUSIC) audio.ApplyMusicVolume();
        else sounds.SetVolume(volume);
    });

    GameSession session(config, sessionAssets, sounds);
    SnapshotRenderer renderer(config, sessionAssets);

    using Clock = std::chrono::steady_clock;
    auto lastFrame = Clock::now();
    std::chrono::duration<double> frameBudget(options.fpsCap > 0 ? 1.0 / options.fpsCap : 0.0);

    Debug::Info("Main") << "Entering main loop";

    while (!window.shouldClose()) {
        auto frameStart = Clock::now();
        float dt = std::chrono::duration<float>(frameStart - lastFrame).count();
        lastFrame = frameStart;
        dt = std::min(dt, MAX_FRAME_DT);

        window.pollEvents();
        HandleMenuKeys(session, menu, window);

        session.Update(dt, ReadCraftInput());
        Input::Update();

        GameSnapshot snapshot = session.Snapshot();
        renderer.Render(snapshot, menu);

        window.setTitle(SnapshotRenderer::HudText(snapshot, menu));

        window.swapBuffers();

        if (options.fpsCap > 0) {
            std::this_thread::sleep_until(frameStart + std::chrono::duration_cast<Clock::duration>(frameBudget));
        }
    }

    Debug::Info("Main") << "Window closed, final score " << session.State().score;
    return 0;
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    LaunchOptions options;
    try {
        options = ParseLaunchOptions(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help to see usage.\n";
        return 1;
    }

    if (options.showHelp) {
        PrintHelp();
        return 0;
    }

    Debug::Initialize("Driftrock", options.consoleLog);

    int status = 0;
    try {
        status = RunGame(options);
    } catch (const std::runtime_error& e) {
        Debug::Critical("Main") << e.what();
        status = 1;
    }

    Debug::Shutdown();
    return status;
}
