/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_TYPES_HPP
#define NAVIGATION_TYPES_HPP

#include <cstdint>
#include <ostream>

namespace Wayfinder {

using CellIndex = int32_t;
inline constexpr CellIndex INVALID_CELL = -1;

// NOT_LOADED: no grid. INVALID_START / INVALID_GOAL: endpoint has no walkable
// cell within the search radius. UNREACHABLE: both resolved, no connection.
enum class NavQueryResult { SUCCESS, NOT_LOADED, INVALID_START, INVALID_GOAL, UNREACHABLE };

// Stream operator for NavQueryResult to support test output
inline std::ostream& operator<<(std::ostream& os, const NavQueryResult& result) {
    switch (result) {
        case NavQueryResult::SUCCESS: return os << "SUCCESS";
        case NavQueryResult::NOT_LOADED: return os << "NOT_LOADED";
        case NavQueryResult::INVALID_START: return os << "INVALID_START";
        case NavQueryResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case NavQueryResult::UNREACHABLE: return os << "UNREACHABLE";
        default: return os << "UNKNOWN";
    }
}

enum class LinkRegistration { APPLIED, DEFERRED, DROPPED_INVALID_ENDPOINT };

inline std::ostream& operator<<(std::ostream& os, const LinkRegistration& reg) {
    switch (reg) {
        case LinkRegistration::APPLIED: return os << "APPLIED";
        case LinkRegistration::DEFERRED: return os << "DEFERRED";
        case LinkRegistration::DROPPED_INVALID_ENDPOINT: return os << "DROPPED_INVALID_ENDPOINT";
        default: return os << "UNKNOWN";
    }
}

struct PathQueryOptions {
    bool smooth{true};
};

struct NavigationStats {
    uint64_t totalRequests{0};
    uint64_t successfulPaths{0};
    uint64_t notLoaded{0};
    uint64_t invalidStarts{0};
    uint64_t invalidGoals{0};
    uint64_t unreachable{0};
    uint64_t totalExpandedNodes{0};
    uint32_t avgPathLength{0};
};

} // namespace Wayfinder

#endif // NAVIGATION_TYPES_HPP
