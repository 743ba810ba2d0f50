/*
 * Input.cpp
 *
 * Purpose:
 *   Implements the Input helper: immediate key polling and edge-triggered key presses.
 *
 * Notes:
 *   - glfwSetWindowUserPointer() associates the Input instance with the GLFWwindow so the static
 *     callback can forward events to the correct object.
 */

#include "core/Input.h"
#include <GLFW/glfw3.h>

Input::Input(GLFWwindow* window) : m_window(window) {
    glfwSetWindowUserPointer(m_window, this);
    glfwSetKeyCallback(m_window, Input::KeyCallback);
}

bool Input::keyDown(int glfwKey) const {
    return glfwGetKey(m_window, glfwKey) == GLFW_PRESS;
}

bool Input::consumePress(int glfwKey) {
    return m_pressed.erase(glfwKey) > 0;
}

/*
 * GLFW key callback (static).
 *
 * Behavior:
 *   - Records GLFW_PRESS actions only; GLFW_REPEAT and GLFW_RELEASE are ignored.
 */
void Input::KeyCallback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
    auto* self = reinterpret_cast<Input*>(glfwGetWindowUserPointer(window));
    if (!self || action != GLFW_PRESS) return;
    self->m_pressed.insert(key);
}
