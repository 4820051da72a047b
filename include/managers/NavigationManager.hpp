/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_MANAGER_HPP
#define NAVIGATION_MANAGER_HPP

/**
 * @file NavigationManager.hpp
 * @brief Per-scene navigation service: grid build, off-mesh links and path queries
 *
 * Lifecycle:
 * 1. Construct with a NavigationConfig (throws std::invalid_argument if invalid)
 * 2. init() samples the navigable surfaces into a walkability grid (synchronous)
 * 3. Queued links are applied once the grid exists
 * 4. findPath() is answered until clean(); rebuild() resamples the scene
 *
 * Links registered before init() are deferred, not lost. Links are owned by
 * the grid and are discarded by rebuild() and clean().
 *
 * Single-threaded: findPath() leaves the grid and graph untouched but
 * updates the query statistics, and registerLink(), init(), rebuild() and
 * clean() must not overlap a query.
 */

#include <memory>
#include <optional>
#include <vector>
#include "ai/navigation/AStarPathfinder.hpp"
#include "ai/navigation/LinkRegistrar.hpp"
#include "ai/navigation/NavigationConfig.hpp"
#include "ai/navigation/NavigationTypes.hpp"
#include "ai/navigation/PathGraph.hpp"
#include "ai/navigation/SurfaceSampler.hpp"
#include "ai/navigation/WalkabilityGrid.hpp"
#include "ai/navigation/WalkabilityGridBuilder.hpp"
#include "utils/Vector3D.hpp"

namespace Wayfinder {

class NavigationManager {
public:
    explicit NavigationManager(const NavigationConfig& config = NavigationConfig{});
    ~NavigationManager();

    NavigationManager(const NavigationManager&) = delete;
    NavigationManager& operator=(const NavigationManager&) = delete;

    /**
     * @brief Builds the walkability grid for a scene and applies queued links
     * @param surfaces Authoring metadata for every scene surface
     * @param sampler Ray caster over the same surfaces; kept for rebuild()
     * @return true if a grid was built, false when nothing is navigable
     */
    bool init(std::vector<NavSurface> surfaces, std::shared_ptr<const ISurfaceSampler> sampler);

    /**
     * @brief Resamples the scene given to init(), discarding existing links
     * @return true if a grid was built
     */
    bool rebuild();

    // Drops the grid, links, queued links and the scene
    void clean();

    bool isLoaded() const { return m_grid != nullptr; }

    /**
     * @brief Shortest path between two world points
     * @param outPath Cleared, then filled from the resolved start to the resolved end
     * @return Query outcome; outPath is empty unless SUCCESS
     */
    NavQueryResult findPath(const Vector3D& start, const Vector3D& end,
                            const PathQueryOptions& options, std::vector<Vector3D>& outPath) const;

    std::vector<Vector3D> findPath(const Vector3D& start, const Vector3D& end,
                                   const PathQueryOptions& options) const;

    // Uses NavigationConfig::smoothByDefault
    std::vector<Vector3D> findPath(const Vector3D& start, const Vector3D& end) const;

    /**
     * @brief Adds an off-mesh link, or queues it until the grid is built
     * @param cost Traversal cost; unset or non-positive uses the default link cost
     */
    LinkRegistration registerLink(const Vector3D& worldA, const Vector3D& worldB,
                                  bool bidirectional = true,
                                  std::optional<float> cost = std::nullopt);

    size_t getPendingLinkCount() const { return m_registrar.getPendingCount(); }
    size_t getLinkCount() const { return m_graph ? m_graph->getLinks().size() : 0; }

    NavigationStats getStats() const { return m_stats; }
    void resetStats() { m_stats = NavigationStats{}; }

    const WalkabilityGridBuilder::BuildStats& getLastBuildStats() const {
        return m_builder.getLastBuildStats();
    }

    // Debug data access; drawing is left to the caller
    void setDebugDraw(bool enabled) { m_debugDraw = enabled; }
    bool isDebugDrawEnabled() const { return m_debugDraw; }
    void getDebugCellCenters(std::vector<Vector3D>& outCenters) const;

    const WalkabilityGrid* getGrid() const { return m_grid.get(); }
    const PathGraph* getGraph() const { return m_graph.get(); }
    const NavigationConfig& getConfig() const { return m_config; }

private:
    NavigationConfig m_config;
    WalkabilityGridBuilder m_builder;
    LinkRegistrar m_registrar;

    std::vector<NavSurface> m_surfaces;
    std::shared_ptr<const ISurfaceSampler> m_sampler;

    // Declared in dependency order: pathfinder and graph refer to the grid
    std::unique_ptr<WalkabilityGrid> m_grid;
    std::unique_ptr<PathGraph> m_graph;
    std::unique_ptr<AStarPathfinder> m_pathfinder;

    mutable NavigationStats m_stats{};
    bool m_debugDraw{false};

    bool buildGrid();
    void releaseGrid();
    void recordResult(NavQueryResult result, size_t pathLength) const;
    Vector3D resolvePoint(const Vector3D& world, CellIndex cell) const;
};

} // namespace Wayfinder

#endif // NAVIGATION_MANAGER_HPP
