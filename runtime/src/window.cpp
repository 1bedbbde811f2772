#include "window.h"
#include <GLFW/glfw3.h>
#include <iostream>
#include <stdexcept>

namespace flora {

Window::Window(int width, int height, const std::string& title, bool fullscreen) {
    if (glfwInit() != GLFW_TRUE) {
        throw std::runtime_error("GLFW initialization failed");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    window_ = glfwCreateWindow(width, height, title.c_str(),
                               fullscreen ? glfwGetPrimaryMonitor() : nullptr, nullptr);
    if (window_ == nullptr) {
        glfwTerminate();
        throw std::runtime_error("Could not create a " + std::to_string(width) + "x" +
                                 std::to_string(height) + " window");
    }

    glfwGetFramebufferSize(window_, &width_, &height_);
    glfwSetWindowUserPointer(window_, this);
    glfwSetKeyCallback(window_, &Window::onKey);

    std::cout << "[Window] " << width_ << "x" << height_
              << (fullscreen ? " fullscreen" : " windowed") << "\n";
}

Window::~Window() {
    glfwDestroyWindow(window_);
    glfwTerminate();
}

bool Window::isOpen() const {
    return glfwWindowShouldClose(window_) == GLFW_FALSE;
}

void Window::close() {
    glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void Window::pollEvents() {
    pressed_.clear();
    glfwPollEvents();
}

void Window::onKey(GLFWwindow* glfwWindow, int key, int /*scancode*/, int action, int /*mods*/) {
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (self != nullptr && action == GLFW_PRESS && key != GLFW_KEY_UNKNOWN) {
        self->pressed_.insert(key);
    }
}

} // namespace flora
