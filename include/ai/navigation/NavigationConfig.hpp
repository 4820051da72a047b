/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_CONFIG_HPP
#define NAVIGATION_CONFIG_HPP

#include <optional>
#include <string>

namespace Wayfinder {

/**
 * @brief Tunables for grid sampling, graph construction and queries
 *
 * Distances are in world units, angles in degrees.
 *
 * JSON layout accepted by loadNavigationConfig() (all keys optional, may be
 * nested under a top-level "navigation" object):
 * @code
 * { "cellSize": 0.5, "maxGridCells": 256, "maxSlopeDegrees": 45,
 *   "stepHeight": 0.4, "padding": 0.5, "sampleHeight": 2.0,
 *   "nearestCellRadius": 3, "smoothingCosThreshold": 0.996,
 *   "smoothByDefault": true, "defaultLinkCost": 1.0 }
 * @endcode
 */
struct NavigationConfig {
    // Upper bound for maxGridCells and nearestCellRadius; keeps cellsX * cellsZ within int
    static constexpr int MAX_CELLS_PER_AXIS = 16384;

    float cellSize{0.5f};
    int maxGridCells{256};            // per axis
    float maxSlopeDegrees{45.0f};
    float stepHeight{0.4f};
    float padding{0.5f};
    float sampleHeight{2.0f};
    int nearestCellRadius{3};         // rings searched when resolving a world point
    float smoothingCosThreshold{0.996f};
    bool smoothByDefault{true};
    std::optional<float> defaultLinkCost; // unset: one cell width

    /**
     * @brief Checks the configuration contract
     * @return Description of the first violation, or std::nullopt when valid
     */
    std::optional<std::string> validate() const;
};

/**
 * @brief Overrides fields of config with the keys present in a JSON file
 * @param path JSON file path
 * @param config Configuration to update; untouched on failure
 * @return true if the file parsed and every present value was valid
 */
bool loadNavigationConfig(const std::string& path, NavigationConfig& config);

/**
 * @brief Same as loadNavigationConfig() but from an in-memory JSON document
 */
bool parseNavigationConfig(const std::string& json, NavigationConfig& config);

} // namespace Wayfinder

#endif // NAVIGATION_CONFIG_HPP
