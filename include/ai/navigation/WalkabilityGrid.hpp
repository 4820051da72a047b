/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WALKABILITY_GRID_HPP
#define WALKABILITY_GRID_HPP

#include <cstdint>
#include <utility>
#include <vector>
#include "ai/navigation/NavigationTypes.hpp"
#include "utils/Vector3D.hpp"

namespace Wayfinder {

/**
 * @brief Heightfield of fixed-size cells on the XZ plane
 *
 * Cell (x, z) has linear index z * cellsX + x. A cell is either absent or
 * carries the sampled floor height and a traversal cost multiplier.
 */
class WalkabilityGrid {
public:
    WalkabilityGrid(float originX, float originZ, float cellSize, int cellsX, int cellsZ);

    float getOriginX() const { return m_originX; }
    float getOriginZ() const { return m_originZ; }
    float getCellSize() const { return m_cell; }
    int getCellsX() const { return m_cellsX; }
    int getCellsZ() const { return m_cellsZ; }
    int getCellCount() const { return m_cellsX * m_cellsZ; }

    bool inBounds(int x, int z) const {
        return x >= 0 && z >= 0 && x < m_cellsX && z < m_cellsZ;
    }
    bool isValidIndex(CellIndex i) const { return i >= 0 && i < getCellCount(); }

    CellIndex index(int x, int z) const { return z * m_cellsX + x; }
    std::pair<int, int> coords(CellIndex i) const { return {i % m_cellsX, i / m_cellsX}; }

    // Grid coordinates of the cell containing a world point (may be out of bounds,
    // saturated to the int range)
    std::pair<int, int> worldToCell(const Vector3D& world) const;

    // World-space center; Y is the sampled height, or 0 for absent cells
    Vector3D cellCenter(CellIndex i) const;

    void setCell(CellIndex i, float height, float costMultiplier);
    void clearCell(CellIndex i);

    bool isPresent(CellIndex i) const {
        return isValidIndex(i) && m_present[static_cast<size_t>(i)] != 0;
    }
    float getHeight(CellIndex i) const { return m_height[static_cast<size_t>(i)]; }
    float getCostMultiplier(CellIndex i) const { return m_cost[static_cast<size_t>(i)]; }

    /**
     * @brief Finds the present cell under a world point, else in square rings around it
     *
     * Within the first ring that holds a present cell, the cell whose center is
     * closest to the point wins.
     * @param world Query point (only X and Z are used)
     * @param maxRadius Number of rings to search
     * @return Cell index, or INVALID_CELL when nothing is present within the radius
     */
    CellIndex findNearestPresent(const Vector3D& world, int maxRadius) const;

    int getPresentCount() const { return m_presentCount; }

    // Smallest costMultiplier over present cells, 1.0 when none are present
    float getMinCostMultiplier() const;

private:
    float m_originX, m_originZ, m_cell;
    int m_cellsX, m_cellsZ;
    std::vector<uint8_t> m_present; // 0 absent, 1 present
    std::vector<float> m_height;
    std::vector<float> m_cost;
    int m_presentCount{0};

    bool presentAt(int64_t x, int64_t z) const {
        return x >= 0 && z >= 0 && x < m_cellsX && z < m_cellsZ &&
               m_present[static_cast<size_t>(z * m_cellsX + x)] != 0;
    }
};

} // namespace Wayfinder

#endif // WALKABILITY_GRID_HPP
