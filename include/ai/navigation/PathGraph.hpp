/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_GRAPH_HPP
#define PATH_GRAPH_HPP

#include <unordered_map>
#include <vector>
#include "ai/navigation/NavigationTypes.hpp"
#include "ai/navigation/WalkabilityGrid.hpp"

namespace Wayfinder {

struct GraphEdge {
    CellIndex neighbor{INVALID_CELL};
    float cost{0.0f};
};

// Authored edge between two present cells
struct OffMeshLink {
    CellIndex cellA{INVALID_CELL};
    CellIndex cellB{INVALID_CELL};
    bool bidirectional{true};
    float cost{0.0f};
};

/**
 * @brief 8-connected adjacency over a WalkabilityGrid plus off-mesh links
 *
 * Two present neighbours are connected when their height difference is at
 * most stepHeight. The grid must outlive the graph.
 */
class PathGraph {
public:
    PathGraph(const WalkabilityGrid& grid, float stepHeight);

    // Appends the edges leaving cell to out (out is cleared first)
    void neighbors(CellIndex cell, std::vector<GraphEdge>& out) const;
    std::vector<GraphEdge> neighbors(CellIndex cell) const;

    /**
     * @brief Adds a link between two cells
     * @return false (and nothing added) if either endpoint is not a present cell
     *         or the cost is not a positive finite number
     */
    bool addLink(const OffMeshLink& link);
    void clearLinks();
    const std::vector<OffMeshLink>& getLinks() const { return m_links; }

    /**
     * @brief Factor applied to the straight-line heuristic to keep it admissible
     *
     * min(1, smallest cell cost multiplier, smallest link cost / link span).
     */
    float getHeuristicScale() const { return m_heuristicScale; }

    const WalkabilityGrid& getGrid() const { return m_grid; }
    float getStepHeight() const { return m_stepHeight; }

private:
    const WalkabilityGrid& m_grid;
    float m_stepHeight;
    std::vector<OffMeshLink> m_links;
    std::unordered_map<CellIndex, std::vector<GraphEdge>> m_linkEdges;
    float m_cellScale{1.0f};
    float m_heuristicScale{1.0f};
};

} // namespace Wayfinder

#endif // PATH_GRAPH_HPP
