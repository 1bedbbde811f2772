#include "app.h"
#include "renderer.h"
#include "scene_canvas.h"
#include "window.h"

#include <flora/audio/audio_provider.h>
#include <flora/palette.h>
#include <flora/simulation.h>

#include <GLFW/glfw3.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace flora {

volatile std::sig_atomic_t FloraApp::stopRequested = 0;

namespace {

void onStopSignal(int) {
    FloraApp::stopRequested = 1;
}

} // namespace

FloraApp::FloraApp(const FloraConfig& config) : config_(config) {}

void FloraApp::installSignalHandlers() {
    stopRequested = 0;
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
}

int FloraApp::run() {
    installSignalHandlers();

    Window window(config_.width, config_.height, "Flora", config_.fullscreen);

    Renderer renderer;
    if (!renderer.init(window.handle(), window.width(), window.height())) {
        std::cerr << "[Flora] GPU initialization failed\n";
        return 1;
    }

    SceneCanvas canvas;
    if (!canvas.init(renderer.device(), renderer.queue(), renderer.surfaceFormat())) {
        std::cerr << "[Flora] GPU initialization failed\n";
        return 1;
    }

    // The plant is laid out for the real framebuffer (fullscreen can differ)
    FloraConfig sceneConfig = config_;
    sceneConfig.width = window.width();
    sceneConfig.height = window.height();

    std::unique_ptr<audio::AudioProvider> provider =
        audio::openAudioProvider(config_.audio, static_cast<float>(config_.fps.get()));
    FloraSimulation simulation(sceneConfig);

    std::cout << "[Flora] Running at " << config_.fps.get() << " fps with "
              << provider->name() << " audio (Esc to quit, D toggles meters)\n";

    using Clock = std::chrono::steady_clock;
    const auto tickDuration = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / config_.fps.get()));
    auto nextTick = Clock::now();
    const uint64_t maxFrames = static_cast<uint64_t>(config_.frames.get());

    while (window.isOpen() && !stopRequested) {
        window.pollEvents();
        if (window.keyPressed(GLFW_KEY_ESCAPE)) {
            window.close();
        }
        if (window.keyPressed(GLFW_KEY_D)) {
            simulation.overlay().toggle();
        }

        simulation.tick(provider->read());

        Tessellator& tess = canvas.tessellator();
        tess.clear();
        simulation.render(tess);

        renderer.drawFrame(palette::Background, canvas);

        if (maxFrames > 0 && simulation.tickCount() >= maxFrames) {
            break;
        }

        nextTick += tickDuration;
        auto now = Clock::now();
        if (nextTick < now) {
            // Fell behind (slow frame or audio wait), don't try to catch up
            nextTick = now;
        } else {
            std::this_thread::sleep_until(nextTick);
        }
    }

    std::cout << "[Flora] Stopped after " << simulation.tickCount() << " ticks\n";
    return 0;
}

} // namespace flora
