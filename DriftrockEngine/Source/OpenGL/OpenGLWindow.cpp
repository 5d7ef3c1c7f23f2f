#include "OpenGLWindow.hpp"
#include "Utils/Debug/Debug.hpp"
#include <cmath>
#include <stdexcept>

OpenGLWindow::OpenGLWindow(int playfieldWidth, int playfieldHeight, const std::string& title)
    : window(nullptr),
      playfieldAspect(static_cast<float>(playfieldWidth) / static_cast<float>(playfieldHeight)),
      currentTitle(title)
{
    glfwSetErrorCallback([](int code, const char* description) {
        Debug::Error("GLFW") << "GLFW error " << code << ": " << description;
    });

    if (!glfwInit())
        throw std::runtime_error("Failed to initialize GLFW");

    try {
        createContext(playfieldWidth, playfieldHeight);
    } catch (...) {
        if (window) glfwDestroyWindow(window);
        glfwTerminate();
        throw;
    }

    Debug::Info("Window") << "OpenGL " << reinterpret_cast<const char*>(glGetString(GL_VERSION))
                          << ", playfield " << playfieldWidth << "x" << playfieldHeight;
}

OpenGLWindow::~OpenGLWindow() {
    if (window) glfwDestroyWindow(window);
    glfwTerminate();
}

void OpenGLWindow::createContext(int width, int height) {
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    window = glfwCreateWindow(width, height, currentTitle.c_str(), nullptr, nullptr);
    if (!window)
        throw std::runtime_error("Failed to create GLFW window");

    glfwMakeContextCurrent(window);

    glewExperimental = GL_TRUE;
    if (glewInit() != GLEW_OK)
        throw std::runtime_error("Failed to initialize GLEW");

    // Flat 2D scene drawn back to front with alpha blending
    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glfwSetWindowUserPointer(window, this);
    glfwSetFramebufferSizeCallback(window, [](GLFWwindow* handle, int w, int h) {
        auto* self = static_cast<OpenGLWindow*>(glfwGetWindowUserPointer(handle));
        if (self) self->applyViewport(w, h);
    });

    int w = 0, h = 0;
    glfwGetFramebufferSize(window, &w, &h);
    applyViewport(w, h);
}

void OpenGLWindow::applyViewport(int framebufferWidth, int framebufferHeight) const {
    glm::ivec4 viewport = FitViewport(framebufferWidth, framebufferHeight, playfieldAspect);
    glViewport(viewport.x, viewport.y, viewport.z, viewport.w);
}

glm::ivec4 OpenGLWindow::FitViewport(int framebufferWidth, int framebufferHeight, float aspect) {
    // Minimized
    if (framebufferWidth <= 0 || framebufferHeight <= 0 || aspect <= 0.0f)
        return glm::ivec4(0, 0, 0, 0);

    int width = framebufferWidth;
    int height = static_cast<int>(std::lround(width / aspect));
    if (height > framebufferHeight) {
        height = framebufferHeight;
        width = static_cast<int>(std::lround(height * aspect));
    }

    return glm::ivec4((framebufferWidth - width) / 2, (framebufferHeight - height) / 2, width, height);
}

void OpenGLWindow::swapBuffers() {
    glfwSwapBuffers(window);
}

void OpenGLWindow::pollEvents() {
    glfwPollEvents();
}

bool OpenGLWindow::shouldClose() const {
    return glfwWindowShouldClose(window);
}

void OpenGLWindow::close() {
    glfwSetWindowShouldClose(window, GLFW_TRUE);
}

void OpenGLWindow::setTitle(const std::string& title) {
    if (title == currentTitle)
        return;
    currentTitle = title;
    glfwSetWindowTitle(window, currentTitle.c_str());
}
