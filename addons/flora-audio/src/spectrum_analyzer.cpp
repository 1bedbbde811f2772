#include <flora/audio/spectrum_analyzer.h>
#include <flora/math.h>
#include <kiss_fft.h>

#include <algorithm>
#include <cmath>

namespace flora::audio {

BandLayout BandLayout::fromConfig(const AudioConfig& config) {
    BandLayout layout;
    layout.bassLow = config.bassLow;
    layout.bassHigh = config.bassHigh;
    layout.midsHigh = config.midsHigh;
    layout.trebleHigh = config.trebleHigh;
    return layout;
}

struct SpectrumAnalyzer::Impl {
    kiss_fft_cfg cfg = nullptr;
    std::vector<kiss_fft_cpx> fftIn;
    std::vector<kiss_fft_cpx> fftOut;
    std::vector<float> window;  // Hann window
};

SpectrumAnalyzer::SpectrumAnalyzer(uint32_t sampleRate, uint32_t frameSize, BandLayout bands)
    : m_impl(std::make_unique<Impl>())
    , m_sampleRate(sampleRate > 0 ? sampleRate : 44100)
    , m_frameSize(std::max<uint32_t>(frameSize, 2))
    , m_bands(bands) {
    int n = static_cast<int>(m_frameSize);
    m_impl->cfg = kiss_fft_alloc(n, 0, nullptr, nullptr);
    m_impl->fftIn.resize(m_frameSize);
    m_impl->fftOut.resize(m_frameSize);

    m_impl->window.resize(m_frameSize);
    for (int i = 0; i < n; i++) {
        m_impl->window[i] = 0.5f * (1.0f - std::cos(TWO_PI * i / (n - 1)));
    }

    m_spectrum.assign(m_frameSize / 2 + 1, 0.0f);
}

SpectrumAnalyzer::~SpectrumAnalyzer() {
    if (m_impl->cfg) {
        kiss_fft_free(m_impl->cfg);
        m_impl->cfg = nullptr;
    }
}

BandEnergies SpectrumAnalyzer::analyze(const float* samples, uint32_t count) {
    BandEnergies energies;
    std::fill(m_spectrum.begin(), m_spectrum.end(), 0.0f);

    if (!m_impl->cfg || !samples || count == 0) {
        return energies;
    }
    count = std::min(count, m_frameSize);

    bool silent = std::all_of(samples, samples + count, [](float s) { return s == 0.0f; });
    if (silent) {
        return energies;
    }

    double sumSquares = 0.0;
    for (uint32_t i = 0; i < count; i++) {
        double s = samples[i];
        sumSquares += s * s;
    }
    energies.volume = static_cast<float>(std::sqrt(sumSquares / count));

    for (uint32_t i = 0; i < m_frameSize; i++) {
        float s = i < count ? samples[i] : 0.0f;
        if (m_windowEnabled) {
            s *= m_impl->window[i];
        }
        m_impl->fftIn[i].r = s;
        m_impl->fftIn[i].i = 0.0f;
    }

    kiss_fft(m_impl->cfg, m_impl->fftIn.data(), m_impl->fftOut.data());

    for (size_t i = 0; i < m_spectrum.size(); i++) {
        float re = m_impl->fftOut[i].r;
        float im = m_impl->fftOut[i].i;
        m_spectrum[i] = std::sqrt(re * re + im * im);
    }

    energies.bass = bandEnergy(m_bands.bassLow, m_bands.bassHigh);
    energies.mids = bandEnergy(m_bands.bassHigh, m_bands.midsHigh);
    energies.treble = bandEnergy(m_bands.midsHigh, m_bands.trebleHigh);
    return energies;
}

float SpectrumAnalyzer::binFrequency(int index) const {
    return static_cast<float>(index) * m_sampleRate / m_frameSize;
}

int SpectrumAnalyzer::frequencyToBin(float hz) const {
    int bin = static_cast<int>(hz * m_frameSize / m_sampleRate + 0.5f);
    return std::clamp(bin, 0, static_cast<int>(m_spectrum.size()) - 1);
}

float SpectrumAnalyzer::bandEnergy(float lowHz, float highHz) const {
    float sum = 0.0f;
    int count = 0;
    for (size_t i = 0; i < m_spectrum.size(); i++) {
        float f = binFrequency(static_cast<int>(i));
        if (f >= lowHz && f < highHz) {
            sum += m_spectrum[i];
            count++;
        }
    }
    return count > 0 ? sum / count : 0.0f;
}

} // namespace flora::audio
