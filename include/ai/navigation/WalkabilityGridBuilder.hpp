/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WALKABILITY_GRID_BUILDER_HPP
#define WALKABILITY_GRID_BUILDER_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "ai/navigation/NavigationConfig.hpp"
#include "ai/navigation/SurfaceSampler.hpp"
#include "ai/navigation/WalkabilityGrid.hpp"

namespace Wayfinder {

/**
 * @brief Samples navigable surfaces top-down into a WalkabilityGrid
 *
 * One downward ray per cell center. The first hit whose normal is within
 * maxSlopeDegrees of up becomes the cell floor; cells without such a hit
 * stay absent.
 */
class WalkabilityGridBuilder {
public:
    struct BuildStats {
        uint32_t cellsX{0};
        uint32_t cellsZ{0};
        uint32_t raycasts{0};
        uint32_t presentCells{0};
        uint32_t slopeRejected{0}; // hit something, but nothing flat enough
        uint32_t noHit{0};
    };

    // Throws std::invalid_argument if config fails validation
    explicit WalkabilityGridBuilder(const NavigationConfig& config);

    /**
     * @brief Builds a grid over the union of the navigable surface bounds
     * @param surfaces Surface metadata, indexed by RaycastHit::surfaceIndex
     * @param sampler Ray caster over the same surfaces
     * @return The grid, or nullptr when there is no navigable surface
     */
    std::unique_ptr<WalkabilityGrid> build(const std::vector<NavSurface>& surfaces,
                                           const ISurfaceSampler& sampler);

    const BuildStats& getLastBuildStats() const { return m_lastStats; }
    const NavigationConfig& getConfig() const { return m_config; }

private:
    NavigationConfig m_config;
    BuildStats m_lastStats{};
};

} // namespace Wayfinder

#endif // WALKABILITY_GRID_BUILDER_HPP
