#include <flora/audio_levels.h>
#include <flora/math.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace flora {

float& BandLevels::operator[](size_t index) {
    switch (index) {
        case 0: return volume;
        case 1: return bass;
        case 2: return mids;
        case 3: return treble;
        default: throw std::out_of_range("BandLevels index out of range");
    }
}

float BandLevels::operator[](size_t index) const {
    return const_cast<BandLevels&>(*this)[index];
}

AudioNormalizer::AudioNormalizer() {
    reset();
}

void AudioNormalizer::reset() {
    for (size_t i = 0; i < BandLevels::COUNT; i++) {
        m_levels[i] = 0.0f;
        m_peaks[i] = INITIAL_PEAK;
    }
}

float AudioNormalizer::sanitize(float raw) {
    return std::isfinite(raw) ? raw : 0.0f;
}

const BandLevels& AudioNormalizer::update(const BandLevels& raw) {
    for (size_t i = 0; i < BandLevels::COUNT; i++) {
        float value = sanitize(raw[i]);

        float& peak = m_peaks[i];
        peak = std::max(peak, value);

        float normalized = value / peak;
        m_levels[i] = smoothValue(m_levels[i], normalized, SMOOTHING);

        peak *= PEAK_DECAY;
        // Decay must never take the tracker to zero
        peak = std::max(peak, INITIAL_PEAK);
    }
    return m_levels;
}

} // namespace flora
