#pragma once
#include <string>
#include <unordered_set>

struct GLFWwindow;

namespace flora {

/**
 * @brief Fixed-size GLFW window without a client API (WebGPU renders into it).
 *
 * Throws std::runtime_error if GLFW or the window cannot be created.
 */
class Window {
public:
    Window(int width, int height, const std::string& title, bool fullscreen = false);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool isOpen() const;
    void close();

    /// @brief Process pending events; key presses from the previous poll are dropped
    void pollEvents();

    /// @brief True if the key went down during the last pollEvents()
    bool keyPressed(int key) const { return pressed_.count(key) > 0; }

    GLFWwindow* handle() const { return window_; }

    /// Framebuffer size in pixels (may differ from the request in fullscreen)
    int width() const { return width_; }
    int height() const { return height_; }

private:
    static void onKey(GLFWwindow* window, int key, int scancode, int action, int mods);

    GLFWwindow* window_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    std::unordered_set<int> pressed_;
};

} // namespace flora
