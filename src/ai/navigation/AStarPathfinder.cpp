/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/AStarPathfinder.hpp"
#include <format>
#include "core/Logger.hpp"

namespace Wayfinder {

AStarPathfinder::AStarPathfinder(const PathGraph& graph, int nearestCellRadius)
    : m_graph(graph), m_nearestRadius(nearestCellRadius) {}

AStarPathfinder::NodePool& AStarPathfinder::pool() {
    thread_local NodePool nodePool;
    return nodePool;
}

CellIndex AStarPathfinder::resolveCell(const Vector3D& world) const {
    return m_graph.getGrid().findNearestPresent(world, m_nearestRadius);
}

uint64_t AStarPathfinder::getLastExpandedCount() const {
    return pool().lastExpanded;
}

NavQueryResult AStarPathfinder::findPath(const Vector3D& start, const Vector3D& goal,
                                         std::vector<CellIndex>& outCells) const {
    outCells.clear();

    const CellIndex s = resolveCell(start);
    if (s == INVALID_CELL) {
        PATHFIND_DEBUG(std::format("findPath: no walkable cell within {} rings of start ({:.2f}, {:.2f}, {:.2f})",
                       m_nearestRadius, start.getX(), start.getY(), start.getZ()));
        pool().lastExpanded = 0;
        return NavQueryResult::INVALID_START;
    }

    const CellIndex g = resolveCell(goal);
    if (g == INVALID_CELL) {
        PATHFIND_DEBUG(std::format("findPath: no walkable cell within {} rings of goal ({:.2f}, {:.2f}, {:.2f})",
                       m_nearestRadius, goal.getX(), goal.getY(), goal.getZ()));
        pool().lastExpanded = 0;
        return NavQueryResult::INVALID_GOAL;
    }

    return findCellPath(s, g, outCells);
}

NavQueryResult AStarPathfinder::findCellPath(CellIndex start, CellIndex goal,
                                             std::vector<CellIndex>& outCells) const {
    outCells.clear();
    const WalkabilityGrid& grid = m_graph.getGrid();

    NodePool& nodePool = pool();
    if (!grid.isPresent(start)) {
        nodePool.lastExpanded = 0;
        return NavQueryResult::INVALID_START;
    }
    if (!grid.isPresent(goal)) {
        nodePool.lastExpanded = 0;
        return NavQueryResult::INVALID_GOAL;
    }

    nodePool.ensureCapacity(grid.getCellCount());
    nodePool.reset();

    if (start == goal) {
        outCells.push_back(start);
        nodePool.lastExpanded = 1;
        return NavQueryResult::SUCCESS;
    }

    auto& open = nodePool.openQueue;
    auto& gScore = nodePool.gScoreBuffer;
    auto& parent = nodePool.parentBuffer;
    auto& closed = nodePool.closedBuffer;
    auto& edges = nodePool.edgeBuffer;

    const Vector3D goalCenter = grid.cellCenter(goal);
    const float hScale = m_graph.getHeuristicScale();
    auto h = [&](CellIndex i) {
        return Vector3D::planarDistance(grid.cellCenter(i), goalCenter) * hScale;
    };

    gScore[static_cast<size_t>(start)] = 0.0f;
    open.push(NodePool::Node{start, h(start)});

    while (!open.empty()) {
        NodePool::Node cur = open.top();
        open.pop();

        const size_t cIndex = static_cast<size_t>(cur.index);
        if (closed[cIndex]) continue;
        closed[cIndex] = 1;
        ++nodePool.lastExpanded;

        if (cur.index == goal) {
            // reconstruct
            for (CellIndex c = goal; c != INVALID_CELL; c = parent[static_cast<size_t>(c)]) {
                outCells.push_back(c);
            }
            std::reverse(outCells.begin(), outCells.end());
            return NavQueryResult::SUCCESS;
        }

        const float gCur = gScore[cIndex];
        m_graph.neighbors(cur.index, edges);
        for (const GraphEdge& edge : edges) {
            const size_t nIndex = static_cast<size_t>(edge.neighbor);
            if (closed[nIndex]) continue;

            const float tentative = gCur + edge.cost;
            if (tentative < gScore[nIndex]) {
                gScore[nIndex] = tentative;
                parent[nIndex] = cur.index;
                open.push(NodePool::Node{edge.neighbor, tentative + h(edge.neighbor)});
            }
        }
    }

    PATHFIND_DEBUG(std::format("findPath: open set exhausted after {} expansions, cells {} -> {} unreachable",
                   nodePool.lastExpanded, start, goal));
    return NavQueryResult::UNREACHABLE;
}

} // namespace Wayfinder
