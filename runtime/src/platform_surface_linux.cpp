// X11 surface through GLFW's native access (GLFW_EXPOSE_NATIVE_X11 comes from the build)
#include "platform_surface.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <GLFW/glfw3native.h>

#include <iostream>

namespace flora {

WGPUSurface createWindowSurface(WGPUInstance instance, GLFWwindow* window) {
    Display* display = glfwGetX11Display();
    if (instance == nullptr || display == nullptr) {
        std::cerr << "[PlatformSurface] No X11 display\n";
        return nullptr;
    }

    WGPUSurfaceSourceXlibWindow source = {};
    source.chain.sType = WGPUSType_SurfaceSourceXlibWindow;
    source.display = display;
    source.window = glfwGetX11Window(window);

    WGPUSurfaceDescriptor desc = {};
    desc.nextInChain = &source.chain;
    desc.label = WGPUStringView{.data = "FloraSurface", .length = WGPU_STRLEN};

    return wgpuInstanceCreateSurface(instance, &desc);
}

} // namespace flora
