#pragma once
#include <webgpu/webgpu.h>
#include <glm/glm.hpp>

struct GLFWwindow;

namespace flora {

class SceneCanvas;

/**
 * @brief Owns the WebGPU instance, surface, adapter, device and queue.
 *
 * Each frame is one render pass: clear to the background color, then let
 * the scene canvas draw its batched triangles, then present.
 */
class Renderer {
public:
    Renderer() = default;
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    /// @brief Create the GPU objects for a window of the given framebuffer size
    bool init(GLFWwindow* window, int width, int height);
    void shutdown();

    /// @brief Clear, draw the canvas and present (skipped while the surface is not ready)
    void drawFrame(const glm::vec3& clearColor, SceneCanvas& canvas);

    WGPUDevice device() const { return device_; }
    WGPUQueue queue() const { return queue_; }
    WGPUTextureFormat surfaceFormat() const { return surfaceFormat_; }

private:
    bool requestAdapter();
    bool requestDevice();
    void configureSurface();
    WGPUTextureView acquireView(WGPUTexture& texture);

    WGPUInstance instance_ = nullptr;
    WGPUSurface surface_ = nullptr;
    WGPUAdapter adapter_ = nullptr;
    WGPUDevice device_ = nullptr;
    WGPUQueue queue_ = nullptr;
    WGPUTextureFormat surfaceFormat_ = WGPUTextureFormat_BGRA8Unorm;

    int width_ = 0;
    int height_ = 0;
};

} // namespace flora
