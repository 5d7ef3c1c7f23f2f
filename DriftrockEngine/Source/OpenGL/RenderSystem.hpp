#ifndef RENDER_SYSTEM_HPP
#define RENDER_SYSTEM_HPP

#include "Mesh.hpp"
#include "OpenGLIncludes.hpp"

// Flat-color 2D renderer. One shader program; each draw sets the model
// matrix and color uniforms.
class RenderSystem {
public:
    RenderSystem();
    ~RenderSystem();

    RenderSystem(const RenderSystem&) = delete;
    RenderSystem& operator=(const RenderSystem&) = delete;

    // Orthographic projection over [0, width] x [0, height] with +y down.
    static glm::mat4 ScreenProjection(float width, float height);

    void BeginFrame(const glm::mat4& projection, const glm::vec3& clearColor);
    void Draw(const Mesh& mesh, const glm::mat4& model);
    void Draw(const Mesh& mesh, const glm::mat4& model, const glm::vec3& color);
    void EndFrame();

private:
    unsigned int shaderProgram;
    int modelLoc, viewLoc, projectionLoc, colorLoc;

    void initializeShaders();
    unsigned int compileShader(const char* source, unsigned int type);
};

#endif // RENDER_SYSTEM_HPP
