/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LINK_REGISTRAR_HPP
#define LINK_REGISTRAR_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include "ai/navigation/NavigationTypes.hpp"
#include "ai/navigation/PathGraph.hpp"
#include "utils/Vector3D.hpp"

namespace Wayfinder {

// Link request in world space, waiting for a grid when none exists yet
struct PendingLink {
    Vector3D worldA;
    Vector3D worldB;
    bool bidirectional{true};
    std::optional<float> cost;
};

/**
 * @brief Resolves off-mesh link endpoints to cells and adds them to a graph
 *
 * While detached, requests queue up in FIFO order. attach() drains the queue
 * into the new graph once and clears it; later requests apply immediately.
 */
class LinkRegistrar {
public:
    LinkRegistrar(int nearestCellRadius, std::optional<float> defaultLinkCost);

    LinkRegistration registerLink(const PendingLink& link);

    /**
     * @brief Binds to a freshly built graph and applies every queued link
     * @return Number of queued links applied (the rest were dropped)
     */
    size_t attach(PathGraph& graph);
    void detach() { m_graph = nullptr; }

    bool isAttached() const { return m_graph != nullptr; }
    size_t getPendingCount() const { return m_pending.size(); }
    void clearPending() { m_pending.clear(); }

private:
    int m_nearestRadius;
    std::optional<float> m_defaultCost;
    PathGraph* m_graph{nullptr};
    std::deque<PendingLink> m_pending;

    LinkRegistration apply(const PendingLink& link);
    float resolveCost(const std::optional<float>& cost) const;
};

} // namespace Wayfinder

#endif // LINK_REGISTRAR_HPP
