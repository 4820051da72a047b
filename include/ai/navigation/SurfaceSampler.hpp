/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SURFACE_SAMPLER_HPP
#define SURFACE_SAMPLER_HPP

#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include "utils/Vector3D.hpp"

namespace Wayfinder {

// World-space axis aligned box
struct Bounds3D {
    Vector3D min;
    Vector3D max;

    float width() const { return max.getX() - min.getX(); }
    float height() const { return max.getY() - min.getY(); }
    float depth() const { return max.getZ() - min.getZ(); }

    void merge(const Bounds3D& other) {
        min = Vector3D(std::min(min.getX(), other.min.getX()),
                       std::min(min.getY(), other.min.getY()),
                       std::min(min.getZ(), other.min.getZ()));
        max = Vector3D(std::max(max.getX(), other.max.getX()),
                       std::max(max.getY(), other.max.getY()),
                       std::max(max.getZ(), other.max.getZ()));
    }

    void include(const Vector3D& p) { merge(Bounds3D{p, p}); }
};

/**
 * @brief Authoring metadata of one scene surface, read at grid build time
 */
struct NavSurface {
    std::string name;
    Bounds3D bounds;
    bool navigable{false};
    std::optional<float> costMultiplier; // honoured only when > 0
};

struct RaycastHit {
    float distance{0.0f};
    Vector3D point;
    Vector3D normal;
    int surfaceIndex{-1}; // index into the NavSurface list the sampler was built from
};

/**
 * @brief Ray casting capability against the navigable scene geometry
 *
 * Implementations only report hits on surfaces flagged navigable.
 */
class ISurfaceSampler {
public:
    virtual ~ISurfaceSampler() = default;

    /**
     * @brief Casts a ray and collects every intersection along it
     * @param origin Ray origin in world space
     * @param direction Ray direction (need not be normalized)
     * @param maxDistance Maximum distance along the normalized direction
     * @param outHits Cleared, then filled ordered by distance (closest first)
     * @return true if at least one navigable surface was hit
     */
    virtual bool raycast(const Vector3D& origin, const Vector3D& direction, float maxDistance,
                         std::vector<RaycastHit>& outHits) const = 0;
};

} // namespace Wayfinder

#endif // SURFACE_SAMPLER_HPP
