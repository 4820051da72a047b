/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/LinkRegistrar.hpp"
#include <cmath>
#include <format>
#include "core/Logger.hpp"

namespace Wayfinder {

LinkRegistrar::LinkRegistrar(int nearestCellRadius, std::optional<float> defaultLinkCost)
    : m_nearestRadius(nearestCellRadius), m_defaultCost(defaultLinkCost) {}

LinkRegistration LinkRegistrar::registerLink(const PendingLink& link) {
    if (!m_graph) {
        m_pending.push_back(link);
        NAVLINK_DEBUG(std::format("Navigation not loaded, link queued ({} pending)", m_pending.size()));
        return LinkRegistration::DEFERRED;
    }
    return apply(link);
}

size_t LinkRegistrar::attach(PathGraph& graph) {
    m_graph = &graph;

    size_t applied = 0;
    const size_t queued = m_pending.size();
    while (!m_pending.empty()) {
        PendingLink link = m_pending.front();
        m_pending.pop_front();
        if (apply(link) == LinkRegistration::APPLIED) ++applied;
    }

    if (queued > 0) {
        NAVLINK_INFO(std::format("Applied {} of {} deferred links", applied, queued));
    }
    return applied;
}

float LinkRegistrar::resolveCost(const std::optional<float>& cost) const {
    if (cost && *cost > 0.0f && std::isfinite(*cost)) return *cost;
    if (m_defaultCost) return *m_defaultCost;
    return m_graph->getGrid().getCellSize();
}

LinkRegistration LinkRegistrar::apply(const PendingLink& link) {
    const WalkabilityGrid& grid = m_graph->getGrid();
    const CellIndex a = grid.findNearestPresent(link.worldA, m_nearestRadius);
    const CellIndex b = grid.findNearestPresent(link.worldB, m_nearestRadius);

    if (a == INVALID_CELL || b == INVALID_CELL) {
        const Vector3D& bad = (a == INVALID_CELL) ? link.worldA : link.worldB;
        NAVLINK_WARN(std::format("Dropping link: endpoint ({:.2f}, {:.2f}, {:.2f}) has no walkable cell nearby",
                     bad.getX(), bad.getY(), bad.getZ()));
        return LinkRegistration::DROPPED_INVALID_ENDPOINT;
    }

    OffMeshLink resolved{a, b, link.bidirectional, resolveCost(link.cost)};
    if (!m_graph->addLink(resolved)) {
        NAVLINK_WARN(std::format("Dropping link between cells {} and {}", a, b));
        return LinkRegistration::DROPPED_INVALID_ENDPOINT;
    }

    NAVLINK_DEBUG(std::format("Link {} {} {} (cost {:.2f})", a, link.bidirectional ? "<->" : "->", b,
                  resolved.cost));
    return LinkRegistration::APPLIED;
}

} // namespace Wayfinder
