#include "RenderSystems.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <glm/gtc/constants.hpp>

namespace {
    const float WHITE[3] = { 0.92f, 0.92f, 0.95f };
    const float ROCK_GREY[3] = { 0.70f, 0.66f, 0.60f };
    const float YELLOW[3] = { 1.0f, 0.95f, 0.35f };
    const float FLAME_OUTER[3] = { 1.0f, 0.47f, 0.12f };
    const float FLAME_INNER[3] = { 1.0f, 0.78f, 0.31f };
    const glm::vec3 BACKGROUND(0.02f, 0.02f, 0.05f);
    const glm::vec3 MENU_IDLE(0.45f, 0.45f, 0.50f);
    const glm::vec3 MENU_SELECTED(1.0f, 0.85f, 0.25f);

    const int ROCK_VERTEX_COUNT = 14;

    // Craft drawn pointing along +X; the transform rotation aims it.
    std::vector<float> CraftVerts(const CraftConfig& craft, const SpriteSize& sprite) {
        float nose = 0.5f * sprite.height * craft.noseScale;
        float tail = 0.5f * sprite.height * craft.tailScale;
        float halfWidth = 0.5f * sprite.width * craft.collisionScale;
        return {
            nose, 0.0f, 0.0f,
            -tail, -halfWidth, 0.0f,
            -tail * 0.6f, 0.0f, 0.0f,
            -tail, halfWidth, 0.0f
        };
    }

    // Jagged outline with the sprite's radius. The jitter pattern is fixed
    // per variant so a rock keeps its shape while it spins.
    std::vector<float> RockVerts(const SpriteSize& sprite, int variant) {
        std::vector<float> verts;
        float radius = 0.5f * sprite.width;
        for (int i = 0; i < ROCK_VERTEX_COUNT; ++i) {
            float seed = std::sin((i + 1) * 12.9898f + (variant + 1) * 78.233f) * 43758.5453f;
            float jitter = seed - std::floor(seed);
            float r = radius * (0.78f + 0.22f * jitter);
            float a = glm::two_pi<float>() * i / ROCK_VERTEX_COUNT;
            verts.push_back(std::cos(a) * r);
            verts.push_back(std::sin(a) * r);
            verts.push_back(0.0f);
        }
        return verts;
    }

    std::vector<float> SquareVerts(float halfSize) {
        return {
            -halfSize, -halfSize, 0.0f,
            halfSize, -halfSize, 0.0f,
            halfSize, halfSize, 0.0f,
            -halfSize, halfSize, 0.0f
        };
    }

    std::vector<float> UnitQuadVerts() {
        return {
            0.0f, 0.0f, 0.0f,
            1.0f, 0.0f, 0.0f,
            1.0f, 1.0f, 0.0f,
            0.0f, 1.0f, 0.0f
        };
    }

    std::vector<float> TriangleVerts(const glm::vec2 points[3]) {
        return {
            points[0].x, points[0].y, 0.0f,
            points[1].x, points[1].y, 0.0f,
            points[2].x, points[2].y, 0.0f
        };
    }

    glm::mat4 PlaceRotated(const glm::vec2& position, float degrees, float scale) {
        glm::mat4 model(1.0f);
        model = glm::translate(model, glm::vec3(position, 0.0f));
        model = glm::rotate(model, glm::radians(degrees), glm::vec3(0, 0, 1));
        model = glm::scale(model, glm::vec3(scale, scale, 1.0f));
        return model;
    }

    glm::mat4 PlaceRect(const glm::vec2& origin, const glm::vec2& size) {
        glm::mat4 model = glm::translate(glm::mat4(1.0f), glm::vec3(origin, 0.0f));
        return glm::scale(model, glm::vec3(size, 1.0f));
    }
}

SnapshotRenderer::SnapshotRenderer(const GameConfig& config, const SessionAssets& assets)
    : config(config)
    , projection(RenderSystem::ScreenProjection(config.playfield.width, config.playfield.height))
{
    std::vector<unsigned int> quadInds = { 0, 1, 2, 2, 3, 0 };
    std::vector<unsigned int> craftInds = { 0, 1, 2, 0, 2, 3 };
    glm::vec2 emptyTriangle[3] = { glm::vec2(0.0f), glm::vec2(0.0f), glm::vec2(0.0f) };

    craftMesh = std::make_unique<Mesh>(CraftVerts(config.craft, assets.craft), craftInds, WHITE);
    projectileMesh = std::make_unique<Mesh>(SquareVerts(config.projectile.collisionRadius), quadInds, YELLOW);
    flameOuterMesh = std::make_unique<Mesh>(TriangleVerts(emptyTriangle), std::vector<unsigned int>{}, FLAME_OUTER);
    flameInnerMesh = std::make_unique<Mesh>(TriangleVerts(emptyTriangle), std::vector<unsigned int>{}, FLAME_INNER);
    quadMesh = std::make_unique<Mesh>(UnitQuadVerts(), quadInds, WHITE);
    quadOutlineMesh = std::make_unique<Mesh>(UnitQuadVerts(), std::vector<unsigned int>{}, WHITE, MeshPrimitive::LINE_LOOP);

    std::vector<SpriteSize> rockSprites = assets.rocks;
    if (rockSprites.empty()) rockSprites.push_back(SessionAssets::PlaceholderRock());
    for (size_t i = 0; i < rockSprites.size(); ++i) {
        rockMeshes.push_back(std::make_unique<Mesh>(RockVerts(rockSprites[i], static_cast<int>(i)),
                                                    std::vector<unsigned int>{}, ROCK_GREY, MeshPrimitive::LINE_LOOP));
    }
}

void SnapshotRenderer::Render(const GameSnapshot& snapshot, const MainMenu& menu) {
    renderer.BeginFrame(projection, BACKGROUND);

    // Menu and GameOver screens hide the field; GameOver text is in the title
    switch (snapshot.phase) {
    case GamePhase::Menu:
        DrawMenu(menu);
        break;
    case GamePhase::Playing:
        DrawRocks(snapshot);
        DrawProjectiles(snapshot);
        DrawCraft(snapshot);
        DrawLives(snapshot);
        break;
    case GamePhase::GameOver:
        break;
    }

    renderer.EndFrame();
}

void SnapshotRenderer::DrawRocks(const GameSnapshot& snapshot) {
    for (const RockView& rock : snapshot.rocks) {
        size_t variant = std::min(static_cast<size_t>(std::max(rock.variant, 0)), rockMeshes.size() - 1);
        renderer.Draw(*rockMeshes[variant], PlaceRotated(rock.position, rock.rotation, rock.scale));
    }
}

void SnapshotRenderer::DrawProjectiles(const GameSnapshot& snapshot) {
    for (const ProjectileView& projectile : snapshot.projectiles) {
        renderer.Draw(*projectileMesh, PlaceRotated(projectile.position, 0.0f, 1.0f));
    }
}

void SnapshotRenderer::DrawCraft(const GameSnapshot& snapshot) {
    const CraftView& craft = snapshot.craft;
    if (!craft.alive) return;

    // The flame is drawn even on blink frames, as it belongs to the exhaust
    if (craft.flame.visible) {
        flameOuterMesh->updateVertices(TriangleVerts(craft.flame.outer));
        flameInnerMesh->updateVertices(TriangleVerts(craft.flame.inner));
        renderer.Draw(*flameOuterMesh, glm::mat4(1.0f));
        renderer.Draw(*flameInnerMesh, glm::mat4(1.0f));
    }

    if (!craft.visible) return;
    renderer.Draw(*craftMesh, PlaceRotated(craft.position, craft.facing, 1.0f));
}

void SnapshotRenderer::DrawLives(const GameSnapshot& snapshot) {
    const float iconScale = 0.4f;
    const float spacing = snapshot.craftSprite.width * iconScale + 8.0f;
    glm::vec2 origin(20.0f + spacing * 0.5f, 20.0f + snapshot.craftSprite.height * iconScale * 0.5f);

    for (int i = 0; i < snapshot.lives; ++i) {
        glm::vec2 position = origin + glm::vec2(spacing * i, 0.0f);
        renderer.Draw(*craftMesh, PlaceRotated(position, config.craft.startHeading, iconScale));
    }
}

void SnapshotRenderer::DrawMenu(const MainMenu& menu) {
    const glm::vec2 barSize(config.playfield.width * 0.35f, 24.0f);
    const float gap = 24.0f;
    glm::vec2 origin = config.playfield.Center() - glm::vec2(barSize.x * 0.5f, barSize.y + gap * 0.5f);

    for (int i = 0; i < MainMenu::ITEM_COUNT; ++i) {
        MenuItem item = static_cast<MenuItem>(i);
        glm::vec3 color = item == menu.Selected() ? MENU_SELECTED : MENU_IDLE;
        glm::vec2 barOrigin = origin + glm::vec2(0.0f, (barSize.y + gap) * i);

        glm::vec2 fill(barSize.x * menu.Volume(item), barSize.y);
        if (fill.x > 0.0f) {
            renderer.Draw(*quadMesh, PlaceRect(barOrigin, fill), color);
        }
        renderer.Draw(*quadOutlineMesh, PlaceRect(barOrigin, barSize), color);
    }
}

std::string SnapshotRenderer::HudText(const GameSnapshot& snapshot, const MainMenu& menu) {
    std::ostringstream title;
    title << "Driftrock";

    switch (snapshot.phase) {
    case GamePhase::Menu:
        title << " | " << menu.Describe() << " | Enter to start";
        break;
    case GamePhase::Playing:
        title << " | Score " << snapshot.score << " | Lives " << snapshot.lives << " | Wave " << snapshot.wave;
        break;
    case GamePhase::GameOver:
        title << " | GAME OVER | Score " << snapshot.score << " | Wave " << snapshot.wave
              << " | Enter to play again";
        break;
    }
    return title.str();
}
