#pragma once

#include "OpenGL/Mesh.hpp"
#include "OpenGL/RenderSystem.hpp"
#include "GameConfig.hpp"
#include "GameSnapshot.hpp"
#include "SessionAssets.hpp"
#include "menu.hpp"

#include <memory>
#include <string>
#include <vector>

// Draws a GameSnapshot as flat-colored vector shapes, plus the volume bars
// of the main menu. Needs a current GL context.
class SnapshotRenderer {
public:
    SnapshotRenderer(const GameConfig& config, const SessionAssets& assets);

    void Render(const GameSnapshot& snapshot, const MainMenu& menu);

    // HUD line shown in the window title.
    static std::string HudText(const GameSnapshot& snapshot, const MainMenu& menu);

private:
    void DrawRocks(const GameSnapshot& snapshot);
    void DrawCraft(const GameSnapshot& snapshot);
    void DrawProjectiles(const GameSnapshot& snapshot);
    void DrawLives(const GameSnapshot& snapshot);
    void DrawMenu(const MainMenu& menu);

    GameConfig config;
    RenderSystem renderer;
    glm::mat4 projection;

    std::unique_ptr<Mesh> craftMesh;
    std::unique_ptr<Mesh> projectileMesh;
    std::unique_ptr<Mesh> flameOuterMesh;
    std::unique_ptr<Mesh> flameInnerMesh;
    std::unique_ptr<Mesh> quadMesh;
    std::unique_ptr<Mesh> quadOutlineMesh;
    std::vector<std::unique_ptr<Mesh>> rockMeshes;
};
