/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ASTAR_PATHFINDER_HPP
#define ASTAR_PATHFINDER_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <queue>
#include <vector>
#include "ai/navigation/NavigationTypes.hpp"
#include "ai/navigation/PathGraph.hpp"
#include "utils/Vector3D.hpp"

namespace Wayfinder {

/**
 * @brief A* over a PathGraph
 *
 * The heuristic is the planar distance between cell centers times the graph's
 * heuristic scale. Among open nodes with equal f the lower cell index is
 * expanded first, so identical queries always return identical paths.
 * Scratch buffers are thread_local and reused across queries.
 */
class AStarPathfinder {
public:
    AStarPathfinder(const PathGraph& graph, int nearestCellRadius);

    // Cell under the point, else the first present cell found in square rings
    CellIndex resolveCell(const Vector3D& world) const;

    /**
     * @brief Finds the cheapest cell sequence between two world points
     * @param outCells Cleared, then filled start cell first
     * @return SUCCESS, INVALID_START, INVALID_GOAL or UNREACHABLE
     */
    NavQueryResult findPath(const Vector3D& start, const Vector3D& goal,
                            std::vector<CellIndex>& outCells) const;

    // Same search between already resolved cells
    NavQueryResult findCellPath(CellIndex start, CellIndex goal,
                                std::vector<CellIndex>& outCells) const;

    // Nodes expanded by the last search on the calling thread
    uint64_t getLastExpandedCount() const;

private:
    const PathGraph& m_graph;
    int m_nearestRadius;

    // Object pool for the open set and per-cell buffers
    struct NodePool {
        struct Node { CellIndex index; float f; };
        struct Cmp {
            bool operator()(const Node& a, const Node& b) const {
                if (a.f != b.f) return a.f > b.f;
                return a.index > b.index;
            }
        };

        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<float> gScoreBuffer;
        std::vector<CellIndex> parentBuffer;
        std::vector<uint8_t> closedBuffer;
        std::vector<GraphEdge> edgeBuffer;
        uint64_t lastExpanded{0};

        void ensureCapacity(int gridSize) {
            if (gScoreBuffer.size() < static_cast<size_t>(gridSize)) {
                gScoreBuffer.resize(gridSize);
                parentBuffer.resize(gridSize);
                closedBuffer.resize(gridSize);
            }
        }

        void reset() {
            while (!openQueue.empty()) openQueue.pop();
            std::fill(gScoreBuffer.begin(), gScoreBuffer.end(), std::numeric_limits<float>::infinity());
            std::fill(parentBuffer.begin(), parentBuffer.end(), INVALID_CELL);
            std::fill(closedBuffer.begin(), closedBuffer.end(), 0);
            lastExpanded = 0;
        }
    };

    static NodePool& pool();
};

} // namespace Wayfinder

#endif // ASTAR_PATHFINDER_HPP
