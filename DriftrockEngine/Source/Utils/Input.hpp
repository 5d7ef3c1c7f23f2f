#ifndef INPUT_HPP
#define INPUT_HPP

#include <GLFW/glfw3.h>
#include <unordered_map>

// Keyboard state fed by the GLFW key callback.
class Input {
public:
    enum class KeyState { NONE, PRESSED, HELD, RELEASED };

    // Call once after you create the GLFW window
    static void Init(GLFWwindow* win) {
        window = win;
        keys.clear();
        glfwSetKeyCallback(window, keyCallback);
    }

    // Call once per frame, after the frame has read its input
    static void Update() {
        for (auto &kv : keys) {
            if (kv.second == KeyState::PRESSED)   kv.second = KeyState::HELD;
            else if (kv.second == KeyState::RELEASED) kv.second = KeyState::NONE;
        }
    }

    // Query functions
    static bool KeyTapped(int key)   { return get(key) == KeyState::PRESSED; }
    static bool KeyPressed(int key)  { return get(key) == KeyState::PRESSED || get(key) == KeyState::HELD; }

private:
    static inline GLFWwindow* window = nullptr;
    static inline std::unordered_map<int, KeyState> keys;

    static void keyCallback(GLFWwindow*, int key, int, int action, int) {
        if (action == GLFW_PRESS)   keys[key] = KeyState::PRESSED;
        if (action == GLFW_RELEASE) keys[key] = KeyState::RELEASED;
    }

    static KeyState get(int code) {
        auto it = keys.find(code);
        return it == keys.end() ? KeyState::NONE : it->second;
    }
};

#endif // INPUT_HPP
