/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE AStarPathfinderTests
#include <boost/test/unit_test.hpp>

#include "ai/navigation/AStarPathfinder.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace Wayfinder;

namespace {

// Sum of edge costs along a cell path
float pathCost(const PathGraph& graph, const std::vector<CellIndex>& cells) {
    float total = 0.0f;
    for (size_t i = 0; i + 1 < cells.size(); ++i) {
        bool found = false;
        for (const auto& e : graph.neighbors(cells[i])) {
            if (e.neighbor == cells[i + 1]) {
                total += e.cost;
                found = true;
                break;
            }
        }
        BOOST_REQUIRE_MESSAGE(found, "consecutive path cells must be graph neighbors");
    }
    return total;
}

} // namespace

// 10x10 grid of 1-unit cells, all present at height 0
struct PathfinderFixture {
    PathfinderFixture() : grid(0.0f, 0.0f, 1.0f, 10, 10) {
        for (CellIndex i = 0; i < grid.getCellCount(); ++i) {
            grid.setCell(i, 0.0f, 1.0f);
        }
    }

    void wallAtX(int x, int zFrom, int zTo) {
        for (int z = zFrom; z <= zTo; ++z) grid.clearCell(grid.index(x, z));
    }

    Vector3D center(int x, int z) const { return grid.cellCenter(grid.index(x, z)); }

    WalkabilityGrid grid;
};

BOOST_FIXTURE_TEST_SUITE(PathSearchTests, PathfinderFixture)

BOOST_AUTO_TEST_CASE(StraightLineOnOpenGrid) {
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> cells;
    BOOST_REQUIRE_EQUAL(finder.findPath(center(0, 0), center(5, 0), cells), NavQueryResult::SUCCESS);
    BOOST_CHECK_EQUAL(cells.size(), 6u);
    BOOST_CHECK_EQUAL(cells.front(), grid.index(0, 0));
    BOOST_CHECK_EQUAL(cells.back(), grid.index(5, 0));
    BOOST_CHECK_CLOSE(pathCost(graph, cells), 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(DiagonalPathIsOptimal) {
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> cells;
    BOOST_REQUIRE_EQUAL(finder.findPath(center(0, 0), center(4, 6), cells), NavQueryResult::SUCCESS);
    // Octile distance: 4 diagonals plus 2 straights
    BOOST_CHECK_CLOSE(pathCost(graph, cells), 4.0f * std::sqrt(2.0f) + 2.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(DetoursAroundWall) {
    wallAtX(5, 0, 8);
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> cells;
    BOOST_REQUIRE_EQUAL(finder.findPath(center(2, 0), center(8, 0), cells), NavQueryResult::SUCCESS);
    for (CellIndex c : cells) {
        BOOST_CHECK(grid.isPresent(c));
    }
    bool crossesGap = false;
    for (CellIndex c : cells) {
        if (c == grid.index(5, 9)) crossesGap = true;
    }
    BOOST_CHECK(crossesGap);
}

BOOST_AUTO_TEST_CASE(AvoidsExpensiveCellsWhenCheaperRouteExists) {
    for (int z = 0; z <= 8; ++z) grid.setCell(grid.index(5, z), 0.0f, 50.0f);
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> cells;
    BOOST_REQUIRE_EQUAL(finder.findPath(center(4, 4), center(6, 4), cells), NavQueryResult::SUCCESS);
    BOOST_CHECK_EQUAL(cells.back(), grid.index(6, 4));
    for (CellIndex c : cells) {
        BOOST_CHECK(grid.getCostMultiplier(c) < 50.0f);
    }
}

BOOST_AUTO_TEST_CASE(StartEqualsGoal) {
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> cells;
    BOOST_REQUIRE_EQUAL(finder.findPath(center(3, 3), center(3, 3), cells), NavQueryResult::SUCCESS);
    BOOST_REQUIRE_EQUAL(cells.size(), 1u);
    BOOST_CHECK_EQUAL(cells[0], grid.index(3, 3));
}

BOOST_AUTO_TEST_CASE(DisconnectedRegionsUnreachable) {
    wallAtX(5, 0, 9);
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> cells{1, 2, 3};
    BOOST_CHECK_EQUAL(finder.findPath(center(0, 0), center(9, 9), cells), NavQueryResult::UNREACHABLE);
    BOOST_CHECK(cells.empty());
    BOOST_CHECK_GT(finder.getLastExpandedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(LinkBridgesGap) {
    wallAtX(5, 0, 9);
    PathGraph graph(grid, 0.4f);
    BOOST_REQUIRE(graph.addLink(OffMeshLink{grid.index(4, 2), grid.index(6, 2), true, 2.0f}));
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> cells;
    BOOST_REQUIRE_EQUAL(finder.findPath(center(0, 2), center(9, 2), cells), NavQueryResult::SUCCESS);
    auto it = std::find(cells.begin(), cells.end(), grid.index(4, 2));
    BOOST_REQUIRE(it != cells.end());
    BOOST_REQUIRE(it + 1 != cells.end());
    BOOST_CHECK_EQUAL(*(it + 1), grid.index(6, 2));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(EndpointResolutionTests, PathfinderFixture)

BOOST_AUTO_TEST_CASE(PointOverCellResolvesToIt) {
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);
    BOOST_CHECK_EQUAL(finder.resolveCell(Vector3D(3.2f, 7.0f, 4.9f)), grid.index(3, 4));
}

BOOST_AUTO_TEST_CASE(PointNearGridSnapsWithinRadius) {
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);
    // Two cells left of the grid: the second ring reaches column 0, the same row is closest
    BOOST_CHECK_EQUAL(finder.resolveCell(Vector3D(-1.5f, 0.0f, 4.5f)), grid.index(0, 4));
    // Beyond the radius
    BOOST_CHECK_EQUAL(finder.resolveCell(Vector3D(-4.5f, 0.0f, 4.5f)), INVALID_CELL);
}

BOOST_AUTO_TEST_CASE(PointOverAbsentCellSnapsToNeighbor) {
    grid.clearCell(grid.index(5, 5));
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 1);

    CellIndex c = finder.resolveCell(center(5, 5));
    BOOST_REQUIRE_NE(c, INVALID_CELL);
    auto [x, z] = grid.coords(c);
    BOOST_CHECK_LE(std::abs(x - 5), 1);
    BOOST_CHECK_LE(std::abs(z - 5), 1);
}

BOOST_AUTO_TEST_CASE(UnresolvableEndpointsReported) {
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 2);
    const Vector3D farAway(100.0f, 0.0f, 100.0f);

    std::vector<CellIndex> cells;
    BOOST_CHECK_EQUAL(finder.findPath(farAway, center(1, 1), cells), NavQueryResult::INVALID_START);
    BOOST_CHECK_EQUAL(finder.findPath(center(1, 1), farAway, cells), NavQueryResult::INVALID_GOAL);
    BOOST_CHECK(cells.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DeterminismTests, PathfinderFixture)

BOOST_AUTO_TEST_CASE(IdenticalQueriesReturnIdenticalPaths) {
    PathGraph graph(grid, 0.4f);
    AStarPathfinder finder(graph, 3);

    std::vector<CellIndex> first;
    std::vector<CellIndex> second;
    BOOST_REQUIRE_EQUAL(finder.findPath(center(1, 1), center(8, 6), first), NavQueryResult::SUCCESS);

    // Unrelated query in between reuses the scratch buffers
    std::vector<CellIndex> other;
    finder.findPath(center(9, 9), center(0, 3), other);

    BOOST_REQUIRE_EQUAL(finder.findPath(center(1, 1), center(8, 6), second), NavQueryResult::SUCCESS);
    BOOST_CHECK_EQUAL_COLLECTIONS(first.begin(), first.end(), second.begin(), second.end());
}

BOOST_AUTO_TEST_CASE(SeparateGraphInstancesAgree) {
    PathGraph graphA(grid, 0.4f);
    PathGraph graphB(grid, 0.4f);
    AStarPathfinder finderA(graphA, 3);
    AStarPathfinder finderB(graphB, 3);

    std::vector<CellIndex> a;
    std::vector<CellIndex> b;
    finderA.findPath(center(0, 9), center(9, 0), a);
    finderB.findPath(center(0, 9), center(9, 0), b);
    BOOST_CHECK_EQUAL_COLLECTIONS(a.begin(), a.end(), b.begin(), b.end());
}

BOOST_AUTO_TEST_SUITE_END()
