/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/navigation/NavigationConfig.hpp"
#include "ai/navigation/TriangleSurfaceSampler.hpp"
#include "components/NavComponentRegistry.hpp"
#include "core/Logger.hpp"
#include "managers/NavigationManager.hpp"
#include <exception>
#include <format>
#include <memory>
#include <string>

using namespace Wayfinder;

namespace {

// Two platforms joined by a ramp, plus an island reachable only through a link
std::shared_ptr<TriangleSurfaceSampler> buildDemoScene() {
  auto scene = std::make_shared<TriangleSurfaceSampler>();

  scene->addFloor("LowerPlatform", 0.0f, 0.0f, 4.0f, 4.0f, 0.0f);

  int ramp = scene->addSurface("Ramp", true, 1.5f);
  scene->addQuad(ramp,
                 Vector3D(4.0f, 0.0f, 0.0f), Vector3D(4.0f, 0.0f, 4.0f),
                 Vector3D(8.0f, 1.0f, 4.0f), Vector3D(8.0f, 1.0f, 0.0f));

  scene->addFloor("UpperPlatform", 8.0f, 0.0f, 12.0f, 4.0f, 1.0f);
  scene->addFloor("Island", 14.0f, 0.0f, 18.0f, 4.0f, 1.0f);

  // Decoration, never sampled
  scene->addFloor("Canopy", 0.0f, 0.0f, 4.0f, 4.0f, 3.0f, false);
  return scene;
}

std::string formatPath(const std::vector<Vector3D>& path) {
  std::string out;
  for (const auto& p : path) {
    out += std::format("({:.2f}, {:.2f}, {:.2f}) ", p.getX(), p.getY(), p.getZ());
  }
  return out;
}

} // namespace

int main(int argc, char* argv[]) {
  NavigationConfig config;
  if (argc > 1) {
    if (!loadNavigationConfig(argv[1], config)) {
      DEMO_CRITICAL(std::format("Failed to load navigation config from {}", argv[1]));
      return -1;
    }
    DEMO_INFO(std::format("Navigation config loaded from {}", argv[1]));
  }

  try {
    NavigationManager navigation(config);
    auto scene = buildDemoScene();

    // The link is authored before the mesh, so it waits for the grid
    NavComponentRegistry components;
    components.create("NavLink", NavLinkParams{Vector3D(11.5f, 1.0f, 2.0f), Vector3D(14.5f, 1.0f, 2.0f)});
    components.create("NavMesh", NavMeshParams{scene->surfaces(), scene});
    components.initializeAll(navigation);

    if (!navigation.isLoaded()) {
      DEMO_CRITICAL("Navigation failed to load");
      return -1;
    }

    const Vector3D start(1.0f, 0.0f, 1.0f);
    const Vector3D goal(17.0f, 1.0f, 3.0f);

    std::vector<Vector3D> path;
    NavQueryResult result = navigation.findPath(start, goal, PathQueryOptions{false}, path);
    if (result != NavQueryResult::SUCCESS) {
      DEMO_CRITICAL("Demo query failed");
      return -1;
    }
    DEMO_INFO(std::format("Raw path: {} points", path.size()));

    result = navigation.findPath(start, goal, PathQueryOptions{true}, path);
    if (result != NavQueryResult::SUCCESS) {
      DEMO_CRITICAL("Demo query failed");
      return -1;
    }
    DEMO_INFO(std::format("Smoothed path: {} points: {}", path.size(), formatPath(path)));

    const NavigationStats stats = navigation.getStats();
    DEMO_INFO(std::format("Queries: {}, succeeded: {}, expanded nodes: {}",
                          stats.totalRequests, stats.successfulPaths, stats.totalExpandedNodes));

    navigation.clean();
  } catch (const std::exception& e) {
    DEMO_CRITICAL(std::format("Navigation demo failed: {}", e.what()));
    return -1;
  }

  return 0;
}
