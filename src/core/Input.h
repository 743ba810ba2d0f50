/*
 * Input.h
 *
 * Purpose:
 *   Declares the Input helper that wraps GLFW keyboard polling and the key callback.
 *   Provides immediate key state plus a consumable queue of key presses, so a key held over
 *   several frames triggers its command only once.
 *
 * Design notes:
 *   - Uses a forward declaration of GLFWwindow to keep GLFW/OpenGL headers out of this header.
 *
 * Usage:
 *   - Construct with a valid GLFWwindow*.
 *   - Call consumePress(key) once per frame for every command key.
 */

#pragma once

#include <set>

struct GLFWwindow;

class Input {
public:
    /*
     * Constructor.
     *
     * Parameters:
     *   window : Valid GLFWwindow pointer used for polling and registering the key callback.
     *
     * Side effects:
     *   - Installs this instance as the GLFW window user pointer.
     */
    explicit Input(GLFWwindow* window);

    // true if the key is currently held.
    bool keyDown(int glfwKey) const;

    /*
     * Consumes a pending press of glfwKey.
     *
     * Returns:
     *   true once per physical press (key repeat is ignored).
     */
    bool consumePress(int glfwKey);

private:
    GLFWwindow* m_window = nullptr;

    // Keys pressed since they were last consumed.
    std::set<int> m_pressed;

    static void KeyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
};
