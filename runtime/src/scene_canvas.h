#pragma once

/**
 * @file scene_canvas.h
 * @brief Uploads tessellated scene geometry and draws it in one call
 *
 * The Tessellator does the CPU side (it is the DrawSurface the simulation
 * renders into). SceneCanvas owns the WebGPU pipeline and the persistent
 * vertex/index buffers, which grow as needed and are reused every frame.
 *
 * Usage:
 * @code
 * canvas.init(renderer.device(), renderer.queue(), renderer.surfaceFormat());
 *
 * // Each frame
 * canvas.tessellator().clear();
 * simulation.render(canvas.tessellator());
 * renderer.drawFrame(palette::Background, canvas);
 * @endcode
 */

#include <flora/tessellator.h>
#include <webgpu/webgpu.h>
#include <cstddef>

namespace flora {

class SceneCanvas {
public:
    SceneCanvas();
    ~SceneCanvas();

    SceneCanvas(const SceneCanvas&) = delete;
    SceneCanvas& operator=(const SceneCanvas&) = delete;

    /**
     * @brief Create the pipeline and uniform buffer
     * @return true on success
     */
    bool init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat);

    /// @brief Release all GPU resources
    void cleanup();

    /// @brief Geometry for the current frame
    Tessellator& tessellator() { return m_tessellator; }

    /**
     * @brief Upload and draw the tessellated geometry
     * @param pass Active render pass
     * @param width Target width in pixels
     * @param height Target height in pixels
     */
    void render(WGPURenderPassEncoder pass, int width, int height);

private:
    void createPipeline();
    bool ensureCapacity(WGPUBuffer& buffer, size_t& capacity, size_t needed, size_t minimum,
                        WGPUBufferUsage usage);

    Tessellator m_tessellator;

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8Unorm;

    WGPURenderPipeline m_pipeline = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUBindGroup m_bindGroup = nullptr;
    WGPUBuffer m_uniformBuffer = nullptr;

    WGPUBuffer m_vertexBuffer = nullptr;
    WGPUBuffer m_indexBuffer = nullptr;
    size_t m_vertexCapacity = 0;  // bytes
    size_t m_indexCapacity = 0;   // bytes

    bool m_initialized = false;

    static constexpr size_t INITIAL_VERTEX_CAPACITY = 16384;
    static constexpr size_t INITIAL_INDEX_CAPACITY = 32768;
};

} // namespace flora
