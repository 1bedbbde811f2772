#pragma once
#include <webgpu/webgpu.h>

struct GLFWwindow;

namespace flora {

/// @brief WebGPU surface for a GLFW window, nullptr if the platform is unsupported
WGPUSurface createWindowSurface(WGPUInstance instance, GLFWwindow* window);

} // namespace flora
