/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/WalkabilityGrid.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace Wayfinder {

WalkabilityGrid::WalkabilityGrid(float originX, float originZ, float cellSize, int cellsX, int cellsZ)
    : m_originX(originX), m_originZ(originZ), m_cell(cellSize), m_cellsX(cellsX), m_cellsZ(cellsZ) {

    if (m_cellsX <= 0 || m_cellsZ <= 0) {
        throw std::invalid_argument(std::format("WalkabilityGrid dimensions must be positive: {}x{}",
                                    cellsX, cellsZ));
    }

    if (!(cellSize > 0.0f) || !std::isfinite(cellSize)) {
        throw std::invalid_argument(std::format("WalkabilityGrid cell size must be positive: {}",
                                    cellSize));
    }

    const size_t count = static_cast<size_t>(m_cellsX) * static_cast<size_t>(m_cellsZ);
    if (count > static_cast<size_t>(std::numeric_limits<CellIndex>::max())) {
        throw std::invalid_argument(std::format("WalkabilityGrid {}x{} exceeds the cell index range",
                                    cellsX, cellsZ));
    }
    m_present.assign(count, 0);
    m_height.assign(count, 0.0f);
    m_cost.assign(count, 1.0f);
}

std::pair<int, int> WalkabilityGrid::worldToCell(const Vector3D& world) const {
    // Saturates instead of overflowing for points far outside the grid
    auto toCell = [this](float offset) {
        const double c = std::floor(static_cast<double>(offset) / m_cell);
        if (std::isnan(c)) return std::numeric_limits<int>::min();
        return static_cast<int>(std::clamp(c, static_cast<double>(std::numeric_limits<int>::min()),
                                           static_cast<double>(std::numeric_limits<int>::max())));
    };
    return {toCell(world.getX() - m_originX), toCell(world.getZ() - m_originZ)};
}

Vector3D WalkabilityGrid::cellCenter(CellIndex i) const {
    auto [x, z] = coords(i);
    float wx = m_originX + x * m_cell + m_cell * 0.5f;
    float wz = m_originZ + z * m_cell + m_cell * 0.5f;
    float wy = isPresent(i) ? m_height[static_cast<size_t>(i)] : 0.0f;
    return Vector3D(wx, wy, wz);
}

void WalkabilityGrid::setCell(CellIndex i, float height, float costMultiplier) {
    if (!isValidIndex(i)) return;
    const size_t idx = static_cast<size_t>(i);
    if (!m_present[idx]) ++m_presentCount;
    m_present[idx] = 1;
    m_height[idx] = height;
    m_cost[idx] = costMultiplier;
}

void WalkabilityGrid::clearCell(CellIndex i) {
    if (!isValidIndex(i)) return;
    const size_t idx = static_cast<size_t>(i);
    if (m_present[idx]) --m_presentCount;
    m_present[idx] = 0;
    m_height[idx] = 0.0f;
    m_cost[idx] = 1.0f;
}

CellIndex WalkabilityGrid::findNearestPresent(const Vector3D& world, int maxRadius) const {
    if (maxRadius < 0) maxRadius = 0;

    // Points more than maxRadius rings outside the grid cannot resolve
    const double fx = (static_cast<double>(world.getX()) - m_originX) / m_cell;
    const double fz = (static_cast<double>(world.getZ()) - m_originZ) / m_cell;
    const double reach = static_cast<double>(maxRadius) + 1.0;
    if (!(fx >= -reach && fx < m_cellsX + reach && fz >= -reach && fz < m_cellsZ + reach)) {
        return INVALID_CELL;
    }

    const int64_t gx = static_cast<int64_t>(std::floor(fx));
    const int64_t gz = static_cast<int64_t>(std::floor(fz));
    if (presentAt(gx, gz)) return index(static_cast<int>(gx), static_cast<int>(gz));

    // Only rings between the nearest and farthest grid cell can hold a present cell
    const int64_t lastX = m_cellsX - 1;
    const int64_t lastZ = m_cellsZ - 1;
    const int64_t nearest = std::max({int64_t{1}, -gx, gx - lastX, -gz, gz - lastZ});
    const int64_t farthest = std::max({gx, lastX - gx, gz, lastZ - gz});
    const int64_t rings = std::min<int64_t>(maxRadius, farthest);

    for (int64_t r = nearest; r <= rings; ++r) {
        // Closest center within the first ring holding a present cell, lower index on ties
        CellIndex best = INVALID_CELL;
        float bestDistance = 0.0f;
        auto consider = [&](int64_t x, int64_t z) {
            if (!presentAt(x, z)) return;
            const CellIndex i = index(static_cast<int>(x), static_cast<int>(z));
            const float d = Vector3D::planarDistance(cellCenter(i), world);
            if (best == INVALID_CELL || d < bestDistance || (d == bestDistance && i < best)) {
                best = i;
                bestDistance = d;
            }
        };

        // Left and right columns, then the top and bottom rows, clipped to the grid
        const int64_t z0 = std::max(gz - r, int64_t{0});
        const int64_t z1 = std::min(gz + r, lastZ);
        for (int64_t z = z0; z <= z1; ++z) {
            consider(gx - r, z);
            consider(gx + r, z);
        }
        const int64_t x0 = std::max(gx - r + 1, int64_t{0});
        const int64_t x1 = std::min(gx + r - 1, lastX);
        for (int64_t x = x0; x <= x1; ++x) {
            consider(x, gz - r);
            consider(x, gz + r);
        }
        if (best != INVALID_CELL) return best;
    }
    return INVALID_CELL;
}

float WalkabilityGrid::getMinCostMultiplier() const {
    float minCost = 1.0f;
    bool any = false;
    for (size_t i = 0; i < m_present.size(); ++i) {
        if (!m_present[i]) continue;
        minCost = any ? std::min(minCost, m_cost[i]) : m_cost[i];
        any = true;
    }
    return minCost;
}

} // namespace Wayfinder
