/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/PathGraph.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace Wayfinder {

namespace {
// Cardinals first, then diagonals
constexpr int DX8[8] = {1, -1, 0, 0, 1, 1, -1, -1};
constexpr int DZ8[8] = {0, 0, 1, -1, 1, -1, 1, -1};
}

PathGraph::PathGraph(const WalkabilityGrid& grid, float stepHeight)
    : m_grid(grid), m_stepHeight(stepHeight) {
    m_cellScale = std::min(1.0f, m_grid.getMinCostMultiplier());
    m_heuristicScale = m_cellScale;
}

void PathGraph::neighbors(CellIndex cell, std::vector<GraphEdge>& out) const {
    out.clear();
    if (!m_grid.isPresent(cell)) return;

    auto [cx, cz] = m_grid.coords(cell);
    const float h = m_grid.getHeight(cell);
    const float cost = m_grid.getCostMultiplier(cell);
    const float cardinal = m_grid.getCellSize();
    const float diagonal = cardinal * std::numbers::sqrt2_v<float>;

    for (int d = 0; d < 8; ++d) {
        const int nx = cx + DX8[d];
        const int nz = cz + DZ8[d];
        if (!m_grid.inBounds(nx, nz)) continue;

        const CellIndex n = m_grid.index(nx, nz);
        if (!m_grid.isPresent(n)) continue;
        if (std::fabs(m_grid.getHeight(n) - h) > m_stepHeight) continue;

        const float span = (d < 4) ? cardinal : diagonal;
        out.push_back(GraphEdge{n, span * 0.5f * (cost + m_grid.getCostMultiplier(n))});
    }

    auto it = m_linkEdges.find(cell);
    if (it != m_linkEdges.end()) {
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
}

std::vector<GraphEdge> PathGraph::neighbors(CellIndex cell) const {
    std::vector<GraphEdge> out;
    neighbors(cell, out);
    return out;
}

bool PathGraph::addLink(const OffMeshLink& link) {
    if (!m_grid.isPresent(link.cellA) || !m_grid.isPresent(link.cellB)) return false;
    if (!(link.cost > 0.0f) || !std::isfinite(link.cost)) return false;

    m_links.push_back(link);
    m_linkEdges[link.cellA].push_back(GraphEdge{link.cellB, link.cost});
    if (link.bidirectional) {
        m_linkEdges[link.cellB].push_back(GraphEdge{link.cellA, link.cost});
    }

    const float span = Vector3D::planarDistance(m_grid.cellCenter(link.cellA),
                                                m_grid.cellCenter(link.cellB));
    if (span > 0.0f) {
        m_heuristicScale = std::min(m_heuristicScale, link.cost / span);
    }
    return true;
}

void PathGraph::clearLinks() {
    m_links.clear();
    m_linkEdges.clear();
    m_heuristicScale = m_cellScale;
}

} // namespace Wayfinder
