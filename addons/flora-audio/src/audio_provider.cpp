#include <flora/audio/audio_provider.h>
#include <flora/audio/synthetic_signal.h>
#include <iostream>

namespace flora::audio {

CaptureAudioProvider::CaptureAudioProvider(const AudioConfig& config)
    : m_analyzer(static_cast<uint32_t>(config.sampleRate.get()),
                 static_cast<uint32_t>(config.frameSize.get()),
                 BandLayout::fromConfig(config))
    , m_frame(static_cast<size_t>(config.frameSize.get()), 0.0f) {
    m_analyzer.setWindowEnabled(config.window);
}

bool CaptureAudioProvider::open(int deviceIndex) {
    // Room for a few frames so the callback never blocks on a slow tick
    uint32_t bufferFrames = static_cast<uint32_t>(m_frame.size()) * 4;
    if (!m_capture.init(m_analyzer.sampleRate(), bufferFrames, deviceIndex)) {
        return false;
    }
    if (!m_capture.start()) {
        m_capture.shutdown();
        return false;
    }
    return true;
}

BandEnergies CaptureAudioProvider::read() {
    uint32_t frames = static_cast<uint32_t>(m_frame.size());
    uint32_t got = m_capture.readLatest(m_frame.data(), frames, READ_TIMEOUT);
    if (got != frames) {
        return BandEnergies{};
    }
    return m_analyzer.analyze(m_frame.data(), got);
}

SyntheticAudioProvider::SyntheticAudioProvider(float fps, double startTime)
    : m_step(1.0 / (fps > 0.0f ? fps : 60.0f))
    , m_time(startTime) {}

BandEnergies SyntheticAudioProvider::read() {
    BandEnergies e = syntheticEnergies(m_time);
    m_time += m_step;
    return e;
}

std::unique_ptr<AudioProvider> openAudioProvider(const AudioConfig& config, float fps) {
    if (!config.synthetic) {
        auto capture = std::make_unique<CaptureAudioProvider>(config);
        if (capture->open(config.device)) {
            return capture;
        }
        std::cerr << "[Audio] Could not open an input device, using the synthetic signal\n";
    }

    std::cout << "[Audio] Using synthetic signal\n";
    return std::make_unique<SyntheticAudioProvider>(fps);
}

} // namespace flora::audio
