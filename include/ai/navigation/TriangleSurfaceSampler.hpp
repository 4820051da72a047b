/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRIANGLE_SURFACE_SAMPLER_HPP
#define TRIANGLE_SURFACE_SAMPLER_HPP

#include <string>
#include <vector>
#include <optional>
#include "ai/navigation/SurfaceSampler.hpp"

namespace Wayfinder {

/**
 * @brief ISurfaceSampler over world-space triangle soups
 *
 * Each surface owns a list of triangles and carries the NavSurface metadata
 * the grid builder reads. Bounds are grown as triangles are added.
 * Rays are tested against every triangle of every navigable surface
 * (Moller-Trumbore, double sided).
 */
class TriangleSurfaceSampler : public ISurfaceSampler {
public:
    struct Triangle {
        Vector3D a, b, c;
    };

    /**
     * @brief Adds an empty surface
     * @return Surface index used by the add* helpers and reported in hits
     */
    int addSurface(const std::string& name, bool navigable,
                   std::optional<float> costMultiplier = std::nullopt);

    void addTriangle(int surface, const Vector3D& a, const Vector3D& b, const Vector3D& c);

    // Quad given by four corners in winding order, split along a-c
    void addQuad(int surface, const Vector3D& a, const Vector3D& b,
                 const Vector3D& c, const Vector3D& d);

    // Horizontal rectangle at height y spanning [minX,maxX] x [minZ,maxZ]
    int addFloor(const std::string& name, float minX, float minZ, float maxX, float maxZ, float y,
                 bool navigable = true, std::optional<float> costMultiplier = std::nullopt);

    // Metadata list in surface index order, as consumed by the grid builder
    std::vector<NavSurface> surfaces() const;

    size_t getSurfaceCount() const { return m_surfaces.size(); }
    size_t getTriangleCount() const;

    bool raycast(const Vector3D& origin, const Vector3D& direction, float maxDistance,
                 std::vector<RaycastHit>& outHits) const override;

private:
    struct Surface {
        NavSurface info;
        std::vector<Triangle> triangles;
        bool hasBounds{false};
    };

    std::vector<Surface> m_surfaces;

    Surface* getSurface(int surface);

    static bool intersect(const Vector3D& origin, const Vector3D& dir, const Triangle& tri,
                          float& outT);
};

} // namespace Wayfinder

#endif // TRIANGLE_SURFACE_SAMPLER_HPP
