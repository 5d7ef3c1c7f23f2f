#ifndef OPENGLWINDOW_HPP
#define OPENGLWINDOW_HPP

#include "OpenGLIncludes.hpp"
#include <string>

// Fixed-size window showing a playfield of the given size. If the
// framebuffer differs (HiDPI, window manager resize) the playfield is
// letterboxed so its aspect ratio never changes.
class OpenGLWindow {
public:
    // Throws std::runtime_error when GLFW, the window or GLEW fail.
    OpenGLWindow(int playfieldWidth, int playfieldHeight, const std::string& title);
    ~OpenGLWindow();

    OpenGLWindow(const OpenGLWindow&) = delete;
    OpenGLWindow& operator=(const OpenGLWindow&) = delete;

    void swapBuffers();
    void pollEvents();
    bool shouldClose() const;
    void close();

    // No-op when the title is unchanged.
    void setTitle(const std::string& title);

    GLFWwindow* getWindow() { return window; }

    // Largest centered viewport of the given aspect inside the framebuffer.
    static glm::ivec4 FitViewport(int framebufferWidth, int framebufferHeight, float aspect);

private:
    void createContext(int width, int height);
    void applyViewport(int framebufferWidth, int framebufferHeight) const;

    GLFWwindow* window;
    float playfieldAspect;
    std::string currentTitle;
};

#endif // OPENGLWINDOW_HPP
