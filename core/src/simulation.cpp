#include <flora/simulation.h>
#include <iostream>
#include <random>

namespace flora {

uint32_t FloraSimulation::resolveSeed(int configSeed) {
    if (configSeed > 0) {
        return static_cast<uint32_t>(configSeed);
    }
    std::random_device rd;
    return rd();
}

FloraSimulation::FloraSimulation(const FloraConfig& config)
    : m_rng(resolveSeed(config.seed))
    , m_sparkles(static_cast<float>(config.fps.get())) {
    m_tree.build(TreeShape::forViewport(config.width, config.height), m_rng);
    m_overlay.setVisible(config.overlay);

    std::cout << "[Flora] Seed " << m_rng.seedValue() << ": " << m_tree.branchCount()
              << " branches, " << m_tree.leaves().size() << " leaves, "
              << m_tree.flowers().size() << " flowers\n";
}

void FloraSimulation::tick(const BandEnergies& raw) {
    const BandLevels& levels = m_normalizer.update(raw);
    m_tree.update(levels, m_rng, m_sparkles);
    m_sparkles.update();
    m_compositor.updateShake(levels.bass, m_rng);
    m_ticks++;
}

void FloraSimulation::render(DrawSurface& target) {
    m_scene.clear();
    m_tree.draw(m_scene);
    m_sparkles.draw(m_scene);

    m_compositor.compose(m_scene, target);

    if (m_overlay.visible()) {
        m_overlay.draw(m_normalizer.levels(), target);
    }
}

} // namespace flora
