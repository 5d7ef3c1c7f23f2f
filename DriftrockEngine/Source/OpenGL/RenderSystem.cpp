#include "RenderSystem.hpp"
#include "Utils/Debug/Debug.hpp"
#include <stdexcept>

RenderSystem::RenderSystem()
    : shaderProgram(0), modelLoc(-1), viewLoc(-1), projectionLoc(-1), colorLoc(-1)
{
    initializeShaders();
}

RenderSystem::~RenderSystem() {
    if (shaderProgram) {
        glDeleteProgram(shaderProgram);
    }
}

glm::mat4 RenderSystem::ScreenProjection(float width, float height) {
    return glm::ortho(0.0f, width, height, 0.0f, -1.0f, 1.0f);
}

void RenderSystem::BeginFrame(const glm::mat4& projection, const glm::vec3& clearColor) {
    glClearColor(clearColor.r, clearColor.g, clearColor.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    glUseProgram(shaderProgram);

    glm::mat4 view(1.0f);
    glUniformMatrix4fv(viewLoc, 1, GL_FALSE, glm::value_ptr(view));
    glUniformMatrix4fv(projectionLoc, 1, GL_FALSE, glm::value_ptr(projection));
}

void RenderSystem::Draw(const Mesh& mesh, const glm::mat4& model) {
    const float* c = mesh.getColor();
    Draw(mesh, model, glm::vec3(c[0], c[1], c[2]));
}

void RenderSystem::Draw(const Mesh& mesh, const glm::mat4& model, const glm::vec3& color) {
    glUniformMatrix4fv(modelLoc, 1, GL_FALSE, glm::value_ptr(model));
    glUniform3fv(colorLoc, 1, glm::value_ptr(color));
    mesh.render();
}

void RenderSystem::EndFrame() {
    glUseProgram(0);
}

void RenderSystem::initializeShaders() {
    const char* vertexShaderSource = R"(
    #version 330 core
    layout (location = 0) in vec3 aPos;

    uniform mat4 uModel;
    uniform mat4 uView;
    uniform mat4 uProjection;

    void main() {
        gl_Position = uProjection * uView * uModel * vec4(aPos, 1.0);
    }
    )";

    const char* fragmentShaderSource = R"(
    #version 330 core
    out vec4 FragColor;
    uniform vec3 uColor;

    void main() {
        FragColor = vec4(uColor, 1.0);
    }
    )";

    unsigned int vertexShader = compileShader(vertexShaderSource, GL_VERTEX_SHADER);
    unsigned int fragmentShader = compileShader(fragmentShaderSource, GL_FRAGMENT_SHADER);

    shaderProgram = glCreateProgram();
    glAttachShader(shaderProgram, vertexShader);
    glAttachShader(shaderProgram, fragmentShader);
    glLinkProgram(shaderProgram);

    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    int success;
    char infoLog[512];
    glGetProgramiv(shaderProgram, GL_LINK_STATUS, &success);
    if (!success) {
        glGetProgramInfoLog(shaderProgram, 512, nullptr, infoLog);
        Debug::Error("RenderSystem") << "Shader linking failed: " << infoLog;
        glDeleteProgram(shaderProgram);
        shaderProgram = 0;
        throw std::runtime_error("Failed to link the flat color shader");
    }

    modelLoc = glGetUniformLocation(shaderProgram, "uModel");
    viewLoc = glGetUniformLocation(shaderProgram, "uView");
    projectionLoc = glGetUniformLocation(shaderProgram, "uProjection");
    colorLoc = glGetUniformLocation(shaderProgram, "uColor");
}

unsigned int RenderSystem::compileShader(const char* source, unsigned int type) {
    unsigned int shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    int success;
    char infoLog[512];
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        glGetShaderInfoLog(shader, 512, nullptr, infoLog);
        Debug::Error("RenderSystem") << "Shader compilation failed: " << infoLog;
    }

    return shader;
}
