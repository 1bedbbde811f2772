#include "renderer.h"
#include "platform_surface.h"
#include "scene_canvas.h"
#include <webgpu/wgpu.h>
#include <iostream>
#include <string>

namespace flora {

namespace {

std::string toString(WGPUStringView view) {
    if (!view.data) return "(no message)";
    if (view.length == WGPU_STRLEN) return std::string(view.data);
    return std::string(view.data, view.length);
}

// Result slot for the adapter/device requests, filled by their callbacks
template<typename T>
struct Pending {
    T result = nullptr;
    bool done = false;
};

template<typename T>
T waitFor(WGPUInstance instance, Pending<T>& pending) {
    while (!pending.done) {
        wgpuInstanceProcessEvents(instance);
    }
    return pending.result;
}

bool isUsable(WGPUSurfaceGetCurrentTextureStatus status) {
    return status == WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal ||
           status == WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal;
}

void releaseTexture(WGPUTexture& texture) {
    if (texture) {
        wgpuTextureRelease(texture);
        texture = nullptr;
    }
}

} // namespace

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init(GLFWwindow* window, int width, int height) {
    width_ = width;
    height_ = height;

    WGPUInstanceExtras extras = {};
    extras.chain.sType = static_cast<WGPUSType>(WGPUSType_InstanceExtras);
    extras.backends = WGPUInstanceBackend_Primary;

    WGPUInstanceDescriptor instanceDesc = {};
    instanceDesc.nextInChain = &extras.chain;

    instance_ = wgpuCreateInstance(&instanceDesc);
    if (!instance_) {
        std::cerr << "[Renderer] wgpuCreateInstance failed\n";
        return false;
    }

    surface_ = createWindowSurface(instance_, window);
    if (!surface_) {
        std::cerr << "[Renderer] No surface for the window\n";
        return false;
    }

    if (!requestAdapter() || !requestDevice()) {
        return false;
    }

    queue_ = wgpuDeviceGetQueue(device_);
    configureSurface();

    std::cout << "[Renderer] Ready, " << width_ << "x" << height_ << " surface\n";
    return true;
}

bool Renderer::requestAdapter() {
    WGPURequestAdapterOptions options = {};
    options.compatibleSurface = surface_;

    Pending<WGPUAdapter> pending;
    WGPURequestAdapterCallbackInfo info = {};
    info.mode = WGPUCallbackMode_AllowProcessEvents;
    info.userdata1 = &pending;
    info.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                       WGPUStringView message, void* userdata1, void*) {
        auto* p = static_cast<Pending<WGPUAdapter>*>(userdata1);
        if (status == WGPURequestAdapterStatus_Success) {
            p->result = adapter;
        } else {
            std::cerr << "[Renderer] No adapter: " << toString(message) << "\n";
        }
        p->done = true;
    };

    wgpuInstanceRequestAdapter(instance_, &options, info);
    adapter_ = waitFor(instance_, pending);
    return adapter_ != nullptr;
}

bool Renderer::requestDevice() {
    WGPUDeviceDescriptor desc = {};
    desc.label = WGPUStringView{.data = "FloraDevice", .length = WGPU_STRLEN};
    desc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const*, WGPUErrorType,
                                                   WGPUStringView message, void*, void*) {
        std::cerr << "[WebGPU] " << toString(message) << "\n";
    };

    Pending<WGPUDevice> pending;
    WGPURequestDeviceCallbackInfo info = {};
    info.mode = WGPUCallbackMode_AllowProcessEvents;
    info.userdata1 = &pending;
    info.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                       WGPUStringView message, void* userdata1, void*) {
        auto* p = static_cast<Pending<WGPUDevice>*>(userdata1);
        if (status == WGPURequestDeviceStatus_Success) {
            p->result = device;
        } else {
            std::cerr << "[Renderer] No device: " << toString(message) << "\n";
        }
        p->done = true;
    };

    wgpuAdapterRequestDevice(adapter_, &desc, info);
    device_ = waitFor(instance_, pending);
    return device_ != nullptr;
}

void Renderer::configureSurface() {
    WGPUSurfaceCapabilities caps = {};
    wgpuSurfaceGetCapabilities(surface_, adapter_, &caps);

    // Palette values are display values: take a non-sRGB format when offered
    surfaceFormat_ = caps.formatCount > 0 ? caps.formats[0] : WGPUTextureFormat_BGRA8Unorm;
    for (size_t i = 0; i < caps.formatCount; i++) {
        if (caps.formats[i] == WGPUTextureFormat_BGRA8Unorm ||
            caps.formats[i] == WGPUTextureFormat_RGBA8Unorm) {
            surfaceFormat_ = caps.formats[i];
            break;
        }
    }
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    WGPUSurfaceConfiguration config = {};
    config.device = device_;
    config.format = surfaceFormat_;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.width = static_cast<uint32_t>(width_);
    config.height = static_cast<uint32_t>(height_);
    config.presentMode = WGPUPresentMode_Fifo;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    wgpuSurfaceConfigure(surface_, &config);
}

void Renderer::shutdown() {
    if (surface_ && device_) {
        wgpuSurfaceUnconfigure(surface_);
    }
    if (queue_) wgpuQueueRelease(queue_);
    if (device_) wgpuDeviceRelease(device_);
    if (adapter_) wgpuAdapterRelease(adapter_);
    if (surface_) wgpuSurfaceRelease(surface_);
    if (instance_) wgpuInstanceRelease(instance_);

    queue_ = nullptr;
    device_ = nullptr;
    adapter_ = nullptr;
    surface_ = nullptr;
    instance_ = nullptr;
}

WGPUTextureView Renderer::acquireView(WGPUTexture& texture) {
    WGPUSurfaceTexture frame = {};
    wgpuSurfaceGetCurrentTexture(surface_, &frame);
    texture = frame.texture;

    if (frame.status == WGPUSurfaceGetCurrentTextureStatus_Outdated ||
        frame.status == WGPUSurfaceGetCurrentTextureStatus_Lost) {
        // Stale after a display change or suspend: reconfigure and skip this frame
        releaseTexture(texture);
        configureSurface();
        return nullptr;
    }
    if (!isUsable(frame.status)) {
        std::cerr << "[Renderer] Surface texture unavailable (status " << frame.status << ")\n";
        releaseTexture(texture);
        return nullptr;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = surfaceFormat_;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    return wgpuTextureCreateView(frame.texture, &viewDesc);
}

void Renderer::drawFrame(const glm::vec3& clearColor, SceneCanvas& canvas) {
    if (!device_) return;

    WGPUTexture texture = nullptr;
    WGPUTextureView view = acquireView(texture);
    if (!view) {
        releaseTexture(texture);
        return;
    }

    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device_, nullptr);

    WGPURenderPassColorAttachment color = {};
    color.view = view;
    color.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    color.loadOp = WGPULoadOp_Clear;
    color.storeOp = WGPUStoreOp_Store;
    color.clearValue = {clearColor.r, clearColor.g, clearColor.b, 1.0};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &color;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    canvas.render(pass, width_, height_);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBuffer commands = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuQueueSubmit(queue_, 1, &commands);
    wgpuCommandBufferRelease(commands);
    wgpuCommandEncoderRelease(encoder);

    wgpuSurfacePresent(surface_);
    wgpuTextureViewRelease(view);
    releaseTexture(texture);
}

} // namespace flora
