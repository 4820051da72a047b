/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WalkabilityGridBuilderTests
#include <boost/test/unit_test.hpp>

#include "ai/navigation/TriangleSurfaceSampler.hpp"
#include "ai/navigation/WalkabilityGridBuilder.hpp"
#include "mocks/FakeSurfaceSampler.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace Wayfinder;

namespace {

NavigationConfig unpaddedConfig() {
    NavigationConfig config;
    config.cellSize = 0.5f;
    config.padding = 0.0f;
    return config;
}

// A single navigable 2x2 footprint whose hits come from the fake
std::vector<NavSurface> squareSurface(std::optional<float> cost = std::nullopt) {
    return {NavSurface{"Square", Bounds3D{Vector3D(0.0f, 0.0f, 0.0f), Vector3D(2.0f, 3.0f, 2.0f)}, true, cost}};
}

Vector3D normalAtDegrees(float degrees) {
    float rad = degrees * 3.14159265f / 180.0f;
    return Vector3D(std::sin(rad), std::cos(rad), 0.0f);
}

} // namespace

struct FlatPlaneFixture {
    static constexpr float PLANE_HEIGHT = 1.5f;

    FlatPlaneFixture() : builder(unpaddedConfig()) {
        sampler.addFloor("Plane", 0.0f, 0.0f, 4.0f, 4.0f, PLANE_HEIGHT);
    }

    TriangleSurfaceSampler sampler;
    WalkabilityGridBuilder builder;
};

BOOST_FIXTURE_TEST_SUITE(FlatPlaneSamplingTests, FlatPlaneFixture)

BOOST_AUTO_TEST_CASE(EveryCellPresentAtPlaneHeight) {
    auto grid = builder.build(sampler.surfaces(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getCellsX(), 8);
    BOOST_CHECK_EQUAL(grid->getCellsZ(), 8);
    BOOST_CHECK_EQUAL(grid->getPresentCount(), 64);

    for (CellIndex i = 0; i < grid->getCellCount(); ++i) {
        BOOST_REQUIRE(grid->isPresent(i));
        BOOST_CHECK_CLOSE(grid->getHeight(i), PLANE_HEIGHT, 0.001f);
        BOOST_CHECK_EQUAL(grid->getCostMultiplier(i), 1.0f);
    }
}

BOOST_AUTO_TEST_CASE(CanonicalIndexMapsToCellCenter) {
    auto grid = builder.build(sampler.surfaces(), sampler);
    BOOST_REQUIRE(grid);

    const CellIndex i = grid->index(3, 5);
    BOOST_CHECK_EQUAL(i, 5 * 8 + 3);
    Vector3D c = grid->cellCenter(i);
    BOOST_CHECK_CLOSE(c.getX(), 1.75f, 0.001f);
    BOOST_CHECK_CLOSE(c.getZ(), 2.75f, 0.001f);
    BOOST_CHECK_CLOSE(c.getY(), PLANE_HEIGHT, 0.001f);

    auto [x, z] = grid->worldToCell(c);
    BOOST_CHECK_EQUAL(x, 3);
    BOOST_CHECK_EQUAL(z, 5);
}

BOOST_AUTO_TEST_CASE(OneRaycastPerCell) {
    builder.build(sampler.surfaces(), sampler);
    BOOST_CHECK_EQUAL(builder.getLastBuildStats().raycasts, 64u);
    BOOST_CHECK_EQUAL(builder.getLastBuildStats().presentCells, 64u);
    BOOST_CHECK_EQUAL(builder.getLastBuildStats().noHit, 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(GridExtentTests)

BOOST_AUTO_TEST_CASE(PaddingExpandsGridWithAbsentBorder) {
    NavigationConfig config = unpaddedConfig();
    config.padding = 0.5f;
    WalkabilityGridBuilder builder(config);

    TriangleSurfaceSampler sampler;
    sampler.addFloor("Plane", 0.0f, 0.0f, 4.0f, 4.0f, 0.0f);

    auto grid = builder.build(sampler.surfaces(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getCellsX(), 10);
    BOOST_CHECK_EQUAL(grid->getCellsZ(), 10);
    BOOST_CHECK_CLOSE(grid->getOriginX(), -0.5f, 0.001f);
    BOOST_CHECK_EQUAL(grid->getPresentCount(), 64);
    BOOST_CHECK(!grid->isPresent(grid->index(0, 0)));
    BOOST_CHECK(!grid->isPresent(grid->index(9, 4)));
    BOOST_CHECK(grid->isPresent(grid->index(1, 1)));
}

BOOST_AUTO_TEST_CASE(DimensionsClampedToMaxGridCells) {
    NavigationConfig config = unpaddedConfig();
    config.maxGridCells = 16;
    WalkabilityGridBuilder builder(config);

    TriangleSurfaceSampler sampler;
    sampler.addFloor("Field", 0.0f, 0.0f, 100.0f, 1.0f, 0.0f);

    auto grid = builder.build(sampler.surfaces(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getCellsX(), 16);
    BOOST_CHECK_EQUAL(grid->getCellsZ(), 2);
}

BOOST_AUTO_TEST_CASE(ExtentBeyondIntRangeClampedToMaxGridCells) {
    NavigationConfig config = unpaddedConfig();
    config.cellSize = 1.0f;
    config.maxGridCells = 64;
    WalkabilityGridBuilder builder(config);

    FakeSurfaceSampler sampler([](float x, float z) {
        return std::vector<RaycastHit>{FakeSurfaceSampler::hit(x, 0.0f, z, Vector3D(0.0f, 1.0f, 0.0f))};
    });
    std::vector<NavSurface> surfaces{
        NavSurface{"Continent", Bounds3D{Vector3D(0.0f, 0.0f, 0.0f), Vector3D(1e10f, 0.0f, 1e10f)}, true, std::nullopt}};

    auto grid = builder.build(surfaces, sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getCellsX(), 64);
    BOOST_CHECK_EQUAL(grid->getCellsZ(), 64);
    BOOST_CHECK_EQUAL(grid->getPresentCount(), 64 * 64);
}

BOOST_AUTO_TEST_CASE(DegenerateBoundsStillGetOneCell) {
    WalkabilityGridBuilder builder(unpaddedConfig());
    FakeSurfaceSampler sampler([](float x, float z) {
        return std::vector<RaycastHit>{FakeSurfaceSampler::hit(x, 0.0f, z, Vector3D(0.0f, 1.0f, 0.0f))};
    });
    std::vector<NavSurface> surfaces{
        NavSurface{"Point", Bounds3D{Vector3D(1.0f, 0.0f, 1.0f), Vector3D(1.0f, 0.0f, 1.0f)}, true, std::nullopt}};

    auto grid = builder.build(surfaces, sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getCellCount(), 1);
}

BOOST_AUTO_TEST_CASE(RayStartsAboveAndSpansBounds) {
    NavigationConfig config = unpaddedConfig();
    config.sampleHeight = 2.0f;
    WalkabilityGridBuilder builder(config);

    FakeSurfaceSampler sampler([](float, float) { return std::vector<RaycastHit>{}; });
    std::vector<NavSurface> surfaces{
        NavSurface{"Box", Bounds3D{Vector3D(0.0f, -1.0f, 0.0f), Vector3D(1.0f, 3.0f, 1.0f)}, true, std::nullopt}};

    builder.build(surfaces, sampler);
    BOOST_CHECK_EQUAL(sampler.getRaycastCount(), 4);
    BOOST_CHECK_CLOSE(sampler.getLastOriginY(), 5.0f, 0.001f);
    BOOST_CHECK_CLOSE(sampler.getLastMaxDistance(), 8.0f, 0.001f);
    BOOST_CHECK(sampler.getLastDirection() == Vector3D(0.0f, -1.0f, 0.0f));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SlopeTests)

BOOST_AUTO_TEST_CASE(SteepSurfaceYieldsNoCell) {
    WalkabilityGridBuilder builder(unpaddedConfig()); // 45 degrees
    FakeSurfaceSampler sampler([](float x, float z) {
        return std::vector<RaycastHit>{FakeSurfaceSampler::hit(x, 0.0f, z, normalAtDegrees(60.0f))};
    });

    auto grid = builder.build(squareSurface(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getPresentCount(), 0);
    BOOST_CHECK_EQUAL(builder.getLastBuildStats().slopeRejected, 16u);
}

BOOST_AUTO_TEST_CASE(GentleSurfaceWithinLimitKept) {
    NavigationConfig config = unpaddedConfig();
    config.maxSlopeDegrees = 70.0f;
    WalkabilityGridBuilder builder(config);
    FakeSurfaceSampler sampler([](float x, float z) {
        return std::vector<RaycastHit>{FakeSurfaceSampler::hit(x, 0.0f, z, normalAtDegrees(60.0f))};
    });

    auto grid = builder.build(squareSurface(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getPresentCount(), 16);
}

BOOST_AUTO_TEST_CASE(RealRampSteeperThanLimitRejected) {
    WalkabilityGridBuilder builder(unpaddedConfig());
    TriangleSurfaceSampler sampler;
    int wall = sampler.addSurface("SteepRamp", true);
    // Rises two units per unit: about 63 degrees
    sampler.addQuad(wall,
                    Vector3D(0.0f, 0.0f, 0.0f), Vector3D(0.0f, 0.0f, 2.0f),
                    Vector3D(2.0f, 4.0f, 2.0f), Vector3D(2.0f, 4.0f, 0.0f));

    auto grid = builder.build(sampler.surfaces(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getPresentCount(), 0);
}

BOOST_AUTO_TEST_CASE(VerticalOnlyHitsLeaveCellAbsent) {
    WalkabilityGridBuilder builder(unpaddedConfig());
    FakeSurfaceSampler sampler([](float x, float z) {
        return std::vector<RaycastHit>{FakeSurfaceSampler::hit(x, 1.0f, z, Vector3D(1.0f, 0.0f, 0.0f))};
    });

    auto grid = builder.build(squareSurface(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_EQUAL(grid->getPresentCount(), 0);
}

BOOST_AUTO_TEST_CASE(FirstQualifyingHitIsTopmostWalkable) {
    WalkabilityGridBuilder builder(unpaddedConfig());
    FakeSurfaceSampler sampler([](float x, float z) {
        return std::vector<RaycastHit>{
            FakeSurfaceSampler::hit(x, 0.0f, z, Vector3D(0.0f, 1.0f, 0.0f)),
            FakeSurfaceSampler::hit(x, 3.0f, z, normalAtDegrees(80.0f)),
            FakeSurfaceSampler::hit(x, 1.0f, z, Vector3D(0.0f, 1.0f, 0.0f)),
        };
    });

    auto grid = builder.build(squareSurface(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_REQUIRE(grid->isPresent(0));
    BOOST_CHECK_CLOSE(grid->getHeight(0), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CostAndLoadTests)

BOOST_AUTO_TEST_CASE(CostMultiplierFromSurfaceMetadata) {
    WalkabilityGridBuilder builder(unpaddedConfig());
    TriangleSurfaceSampler sampler;
    sampler.addFloor("Mud", 0.0f, 0.0f, 1.0f, 1.0f, 0.0f, true, 3.0f);
    sampler.addFloor("Stone", 1.0f, 0.0f, 2.0f, 1.0f, 0.0f, true, 0.0f);

    auto grid = builder.build(sampler.surfaces(), sampler);
    BOOST_REQUIRE(grid);
    BOOST_CHECK_CLOSE(grid->getCostMultiplier(grid->index(0, 0)), 3.0f, 0.001f);
    BOOST_CHECK_CLOSE(grid->getCostMultiplier(grid->index(3, 0)), 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(NoNavigableSurfaceIsNotLoaded) {
    WalkabilityGridBuilder builder(unpaddedConfig());
    TriangleSurfaceSampler sampler;
    sampler.addFloor("Decoration", 0.0f, 0.0f, 4.0f, 4.0f, 0.0f, false);

    BOOST_CHECK(builder.build(sampler.surfaces(), sampler) == nullptr);
    BOOST_CHECK(builder.build({}, sampler) == nullptr);
}

BOOST_AUTO_TEST_CASE(InvalidConfigThrows) {
    NavigationConfig config;
    config.cellSize = 0.0f;
    BOOST_CHECK_THROW(WalkabilityGridBuilder{config}, std::invalid_argument);

    config = NavigationConfig{};
    config.maxGridCells = 0;
    BOOST_CHECK_THROW(WalkabilityGridBuilder{config}, std::invalid_argument);

    config = NavigationConfig{};
    config.maxSlopeDegrees = 95.0f;
    BOOST_CHECK_THROW(WalkabilityGridBuilder{config}, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(GridConstructorRejectsBadDimensions) {
    BOOST_CHECK_THROW(WalkabilityGrid(0.0f, 0.0f, 1.0f, 0, 4), std::invalid_argument);
    BOOST_CHECK_THROW(WalkabilityGrid(0.0f, 0.0f, -1.0f, 4, 4), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
