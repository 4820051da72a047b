/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/NavigationManager.hpp"
#include <format>
#include <stdexcept>
#include "ai/navigation/PathSmoother.hpp"
#include "core/Logger.hpp"

namespace Wayfinder {

namespace {
const NavigationConfig& checked(const NavigationConfig& config) {
    if (auto error = config.validate()) {
        throw std::invalid_argument(std::format("NavigationManager: invalid config: {}", *error));
    }
    return config;
}
}

NavigationManager::NavigationManager(const NavigationConfig& config)
    : m_config(checked(config)),
      m_builder(m_config),
      m_registrar(m_config.nearestCellRadius, m_config.defaultLinkCost) {}

NavigationManager::~NavigationManager() {
    releaseGrid();
}

bool NavigationManager::init(std::vector<NavSurface> surfaces,
                             std::shared_ptr<const ISurfaceSampler> sampler) {
    if (isLoaded()) {
        NAVIGATION_WARN("init() called while loaded, replacing the current grid");
    }
    m_surfaces = std::move(surfaces);
    m_sampler = std::move(sampler);
    return buildGrid();
}

bool NavigationManager::rebuild() {
    if (!m_sampler) {
        NAVIGATION_WARN("rebuild() called before init(), nothing to sample");
        return false;
    }
    return buildGrid();
}

void NavigationManager::clean() {
    releaseGrid();
    m_registrar.clearPending();
    m_surfaces.clear();
    m_sampler.reset();
    NAVIGATION_INFO("Navigation cleaned");
}

void NavigationManager::releaseGrid() {
    m_registrar.detach();
    m_pathfinder.reset();
    m_graph.reset();
    m_grid.reset();
}

bool NavigationManager::buildGrid() {
    releaseGrid();

    if (!m_sampler) {
        NAVIGATION_ERROR("No surface sampler, navigation not loaded");
        return false;
    }

    m_grid = m_builder.build(m_surfaces, *m_sampler);
    if (!m_grid) {
        NAVIGATION_WARN("No navigable surfaces in scene, navigation not loaded");
        return false;
    }

    m_graph = std::make_unique<PathGraph>(*m_grid, m_config.stepHeight);
    m_pathfinder = std::make_unique<AStarPathfinder>(*m_graph, m_config.nearestCellRadius);
    m_registrar.attach(*m_graph);

    NAVIGATION_INFO(std::format("Navigation loaded: {}x{} cells ({} walkable), {} links",
                    m_grid->getCellsX(), m_grid->getCellsZ(), m_grid->getPresentCount(),
                    m_graph->getLinks().size()));
    return true;
}

Vector3D NavigationManager::resolvePoint(const Vector3D& world, CellIndex cell) const {
    // A point over its own cell keeps its position, snapped to the floor height
    auto [x, z] = m_grid->worldToCell(world);
    if (m_grid->inBounds(x, z) && m_grid->index(x, z) == cell) {
        return Vector3D(world.getX(), m_grid->getHeight(cell), world.getZ());
    }
    return m_grid->cellCenter(cell);
}

void NavigationManager::recordResult(NavQueryResult result, size_t pathLength) const {
    m_stats.totalRequests++;
    switch (result) {
        case NavQueryResult::SUCCESS: {
            m_stats.successfulPaths++;
            uint64_t totalPathLength = m_stats.avgPathLength * (m_stats.successfulPaths - 1) + pathLength;
            m_stats.avgPathLength = static_cast<uint32_t>(totalPathLength / m_stats.successfulPaths);
            break;
        }
        case NavQueryResult::NOT_LOADED: m_stats.notLoaded++; break;
        case NavQueryResult::INVALID_START: m_stats.invalidStarts++; break;
        case NavQueryResult::INVALID_GOAL: m_stats.invalidGoals++; break;
        case NavQueryResult::UNREACHABLE: m_stats.unreachable++; break;
    }
}

NavQueryResult NavigationManager::findPath(const Vector3D& start, const Vector3D& end,
                                           const PathQueryOptions& options,
                                           std::vector<Vector3D>& outPath) const {
    outPath.clear();

    if (!isLoaded()) {
        recordResult(NavQueryResult::NOT_LOADED, 0);
        return NavQueryResult::NOT_LOADED;
    }

    std::vector<CellIndex> cells;
    NavQueryResult result = m_pathfinder->findPath(start, end, cells);
    m_stats.totalExpandedNodes += m_pathfinder->getLastExpandedCount();
    if (result != NavQueryResult::SUCCESS) {
        recordResult(result, 0);
        return result;
    }

    const Vector3D first = resolvePoint(start, cells.front());
    const Vector3D last = resolvePoint(end, cells.back());

    if (cells.size() == 1) {
        outPath.push_back(first);
        outPath.push_back(last);
    } else {
        outPath.reserve(cells.size());
        outPath.push_back(first);
        for (size_t i = 1; i + 1 < cells.size(); ++i) {
            outPath.push_back(m_grid->cellCenter(cells[i]));
        }
        outPath.push_back(last);

        if (options.smooth) {
            PathSmoother::simplify(outPath, m_config.smoothingCosThreshold);
        }
    }

    recordResult(result, outPath.size());
    return result;
}

std::vector<Vector3D> NavigationManager::findPath(const Vector3D& start, const Vector3D& end,
                                                  const PathQueryOptions& options) const {
    std::vector<Vector3D> path;
    // Failure is already reported through the empty path
    findPath(start, end, options, path);
    return path;
}

std::vector<Vector3D> NavigationManager::findPath(const Vector3D& start, const Vector3D& end) const {
    return findPath(start, end, PathQueryOptions{m_config.smoothByDefault});
}

LinkRegistration NavigationManager::registerLink(const Vector3D& worldA, const Vector3D& worldB,
                                                 bool bidirectional, std::optional<float> cost) {
    return m_registrar.registerLink(PendingLink{worldA, worldB, bidirectional, cost});
}

void NavigationManager::getDebugCellCenters(std::vector<Vector3D>& outCenters) const {
    outCenters.clear();
    if (!m_grid) return;

    outCenters.reserve(static_cast<size_t>(m_grid->getPresentCount()));
    for (CellIndex i = 0; i < m_grid->getCellCount(); ++i) {
        if (m_grid->isPresent(i)) outCenters.push_back(m_grid->cellCenter(i));
    }
}

} // namespace Wayfinder
