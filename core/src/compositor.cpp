#include <flora/compositor.h>
#include <algorithm>

namespace flora {

void SceneCompositor::updateShake(float bass, RandomSource& rng) {
    m_shake = std::max(0.0f, bass) * SHAKE_SCALE;
    m_offset.x = rng.uniform(-1.0f, 1.0f) * m_shake;
    m_offset.y = rng.uniform(-1.0f, 1.0f) * m_shake;
}

void SceneCompositor::compose(const DrawList& scene, DrawSurface& target) const {
    scene.replay(target, m_offset);
}

} // namespace flora
