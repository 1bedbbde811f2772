#include "scene_canvas.h"
#include <algorithm>
#include <cstring>
#include <iostream>

namespace flora {

// Pixel-space triangles with per-vertex color, alpha blended
static const char* SCENE_SHADER = R"(
struct Uniforms {
    resolution: vec2f,
    padding: vec2f,
}

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

struct VertexInput {
    @location(0) position: vec2f,
    @location(1) color: vec4f,
}

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) color: vec4f,
}

@vertex
fn vs_main(in: VertexInput) -> VertexOutput {
    var out: VertexOutput;
    // Convert pixel coords to clip space (-1 to 1)
    let clipX = (in.position.x / uniforms.resolution.x) * 2.0 - 1.0;
    let clipY = 1.0 - (in.position.y / uniforms.resolution.y) * 2.0;
    out.position = vec4f(clipX, clipY, 0.0, 1.0);
    out.color = in.color;
    return out;
}

@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4f {
    return in.color;
}
)";

static WGPUStringView toStringView(const char* str) {
    return {str, strlen(str)};
}

SceneCanvas::SceneCanvas() = default;

SceneCanvas::~SceneCanvas() {
    cleanup();
}

void SceneCanvas::cleanup() {
    if (m_vertexBuffer) {
        wgpuBufferRelease(m_vertexBuffer);
        m_vertexBuffer = nullptr;
    }
    if (m_indexBuffer) {
        wgpuBufferRelease(m_indexBuffer);
        m_indexBuffer = nullptr;
    }
    m_vertexCapacity = 0;
    m_indexCapacity = 0;

    if (m_bindGroup) {
        wgpuBindGroupRelease(m_bindGroup);
        m_bindGroup = nullptr;
    }
    if (m_uniformBuffer) {
        wgpuBufferRelease(m_uniformBuffer);
        m_uniformBuffer = nullptr;
    }
    if (m_bindGroupLayout) {
        wgpuBindGroupLayoutRelease(m_bindGroupLayout);
        m_bindGroupLayout = nullptr;
    }
    if (m_pipeline) {
        wgpuRenderPipelineRelease(m_pipeline);
        m_pipeline = nullptr;
    }

    m_initialized = false;
}

bool SceneCanvas::init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat) {
    if (m_initialized) return true;

    m_device = device;
    m_queue = queue;
    m_surfaceFormat = surfaceFormat;

    createPipeline();
    if (!m_pipeline || !m_bindGroup) {
        std::cerr << "[SceneCanvas] Failed to create pipeline\n";
        cleanup();
        return false;
    }

    m_initialized = true;
    return true;
}

void SceneCanvas::createPipeline() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(SCENE_SHADER);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    WGPUShaderModule shaderModule = wgpuDeviceCreateShaderModule(m_device, &shaderDesc);

    WGPUBindGroupLayoutEntry entry = {};
    entry.binding = 0;
    entry.visibility = WGPUShaderStage_Vertex;
    entry.buffer.type = WGPUBufferBindingType_Uniform;
    entry.buffer.minBindingSize = 16;

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = 1;
    layoutDesc.entries = &entry;
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);

    WGPUVertexAttribute attrs[2] = {};
    attrs[0].format = WGPUVertexFormat_Float32x2;  // position
    attrs[0].offset = offsetof(CanvasVertex, position);
    attrs[0].shaderLocation = 0;
    attrs[1].format = WGPUVertexFormat_Float32x4;  // color
    attrs[1].offset = offsetof(CanvasVertex, color);
    attrs[1].shaderLocation = 1;

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = sizeof(CanvasVertex);
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = 2;
    vertexLayout.attributes = attrs;

    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_surfaceFormat;
    colorTarget.blend = &blendState;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = shaderModule;
    fragmentState.entryPoint = toStringView("fs_main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 1;
    pipelineDesc.vertex.buffers = &vertexLayout;
    pipelineDesc.fragment = &fragmentState;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;  // Fans and quads come in either winding
    pipelineDesc.depthStencil = nullptr;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);

    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(shaderModule);

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.size = 16;
    bufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    m_uniformBuffer = wgpuDeviceCreateBuffer(m_device, &bufferDesc);

    WGPUBindGroupEntry bgEntry = {};
    bgEntry.binding = 0;
    bgEntry.buffer = m_uniformBuffer;
    bgEntry.size = 16;

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.layout = m_bindGroupLayout;
    bgDesc.entryCount = 1;
    bgDesc.entries = &bgEntry;
    m_bindGroup = wgpuDeviceCreateBindGroup(m_device, &bgDesc);
}

bool SceneCanvas::ensureCapacity(WGPUBuffer& buffer, size_t& capacity, size_t needed,
                                 size_t minimum, WGPUBufferUsage usage) {
    if (needed <= capacity && buffer) return true;

    if (buffer) wgpuBufferRelease(buffer);
    size_t newCapacity = std::max(needed, minimum);
    newCapacity = std::max(newCapacity, capacity * 2);

    WGPUBufferDescriptor desc = {};
    desc.size = newCapacity;
    desc.usage = usage | WGPUBufferUsage_CopyDst;
    buffer = wgpuDeviceCreateBuffer(m_device, &desc);
    capacity = buffer ? newCapacity : 0;
    return buffer != nullptr;
}

void SceneCanvas::render(WGPURenderPassEncoder pass, int width, int height) {
    if (!m_initialized) return;

    const auto& vertices = m_tessellator.vertices();
    const auto& indices = m_tessellator.indices();
    if (indices.empty()) return;

    size_t vertexBytes = vertices.size() * sizeof(CanvasVertex);
    size_t indexBytes = indices.size() * sizeof(uint32_t);

    if (!ensureCapacity(m_vertexBuffer, m_vertexCapacity, vertexBytes,
                        INITIAL_VERTEX_CAPACITY * sizeof(CanvasVertex), WGPUBufferUsage_Vertex) ||
        !ensureCapacity(m_indexBuffer, m_indexCapacity, indexBytes,
                        INITIAL_INDEX_CAPACITY * sizeof(uint32_t), WGPUBufferUsage_Index)) {
        std::cerr << "[SceneCanvas] Failed to allocate geometry buffers\n";
        return;
    }

    float uniforms[4] = {static_cast<float>(width), static_cast<float>(height), 0.0f, 0.0f};
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, uniforms, sizeof(uniforms));
    wgpuQueueWriteBuffer(m_queue, m_vertexBuffer, 0, vertices.data(), vertexBytes);
    wgpuQueueWriteBuffer(m_queue, m_indexBuffer, 0, indices.data(), indexBytes);

    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_bindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_vertexBuffer, 0, vertexBytes);
    wgpuRenderPassEncoderSetIndexBuffer(pass, m_indexBuffer, WGPUIndexFormat_Uint32, 0, indexBytes);
    wgpuRenderPassEncoderDrawIndexed(pass, static_cast<uint32_t>(indices.size()), 1, 0, 0, 0);
}

} // namespace flora
