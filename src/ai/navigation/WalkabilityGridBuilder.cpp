/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/WalkabilityGridBuilder.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>
#include <stdexcept>
#include "core/Logger.hpp"

namespace Wayfinder {

WalkabilityGridBuilder::WalkabilityGridBuilder(const NavigationConfig& config)
    : m_config(config) {
    if (auto error = m_config.validate()) {
        throw std::invalid_argument(std::format("WalkabilityGridBuilder: invalid config: {}", *error));
    }
}

std::unique_ptr<WalkabilityGrid> WalkabilityGridBuilder::build(const std::vector<NavSurface>& surfaces,
                                                               const ISurfaceSampler& sampler) {
    m_lastStats = BuildStats{};

    Bounds3D bounds;
    bool anyNavigable = false;
    for (const auto& surface : surfaces) {
        if (!surface.navigable) continue;
        if (anyNavigable) {
            bounds.merge(surface.bounds);
        } else {
            bounds = surface.bounds;
            anyNavigable = true;
        }
    }

    if (!anyNavigable) {
        GRIDBUILD_WARN("No navigable surfaces, navigation stays unloaded");
        return nullptr;
    }

    const float cell = m_config.cellSize;
    const float originX = bounds.min.getX() - m_config.padding;
    const float originZ = bounds.min.getZ() - m_config.padding;
    const float width = bounds.width() + 2.0f * m_config.padding;
    const float depth = bounds.depth() + 2.0f * m_config.padding;

    // Clamped in floating point; the raw count of a huge scene does not fit in int
    const double limit = static_cast<double>(m_config.maxGridCells);
    const double rawX = std::ceil(static_cast<double>(width) / cell);
    const double rawZ = std::ceil(static_cast<double>(depth) / cell);
    auto cellsFor = [limit](double raw) {
        return static_cast<int>(std::isfinite(raw) ? std::clamp(raw, 1.0, limit) : limit);
    };
    const int cellsX = cellsFor(rawX);
    const int cellsZ = cellsFor(rawZ);

    if (!(rawX <= limit) || !(rawZ <= limit)) {
        GRIDBUILD_WARN(std::format("Navigable area {:.2f}x{:.2f} exceeds {} cells per axis, clamped to {}x{}",
                       width, depth, m_config.maxGridCells, cellsX, cellsZ));
    }

    auto grid = std::make_unique<WalkabilityGrid>(originX, originZ, cell, cellsX, cellsZ);

    const float rayTop = bounds.max.getY() + m_config.sampleHeight;
    const float rayLength = bounds.height() + 2.0f * m_config.sampleHeight;
    const float minUp = static_cast<float>(std::cos(m_config.maxSlopeDegrees * std::numbers::pi / 180.0));
    const Vector3D down(0.0f, -1.0f, 0.0f);

    m_lastStats.cellsX = static_cast<uint32_t>(cellsX);
    m_lastStats.cellsZ = static_cast<uint32_t>(cellsZ);

    std::vector<RaycastHit> hits;
    for (int z = 0; z < cellsZ; ++z) {
        for (int x = 0; x < cellsX; ++x) {
            const CellIndex i = grid->index(x, z);
            const Vector3D center = grid->cellCenter(i);
            const Vector3D origin(center.getX(), rayTop, center.getZ());

            ++m_lastStats.raycasts;
            if (!sampler.raycast(origin, down, rayLength, hits)) {
                ++m_lastStats.noHit;
                continue;
            }

            // Hits arrive closest first, so the first flat one is the topmost floor
            auto floor = std::find_if(hits.begin(), hits.end(), [minUp](const RaycastHit& h) {
                return std::fabs(h.normal.getY()) >= minUp;
            });
            if (floor == hits.end()) {
                ++m_lastStats.slopeRejected;
                continue;
            }

            float multiplier = 1.0f;
            if (floor->surfaceIndex >= 0 && static_cast<size_t>(floor->surfaceIndex) < surfaces.size()) {
                const auto& cost = surfaces[static_cast<size_t>(floor->surfaceIndex)].costMultiplier;
                if (cost && *cost > 0.0f && std::isfinite(*cost)) multiplier = *cost;
            }

            grid->setCell(i, floor->point.getY(), multiplier);
            ++m_lastStats.presentCells;
        }
    }

    GRIDBUILD_INFO(std::format("Built {}x{} walkability grid: {} present, {} slope rejected, {} empty",
                   cellsX, cellsZ, m_lastStats.presentCells, m_lastStats.slopeRejected,
                   m_lastStats.noHit));
    return grid;
}

} // namespace Wayfinder
