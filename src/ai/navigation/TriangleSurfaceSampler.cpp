/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/navigation/TriangleSurfaceSampler.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include "core/Logger.hpp"

namespace Wayfinder {

namespace {
constexpr float RAY_EPSILON = 1e-7f;
}

int TriangleSurfaceSampler::addSurface(const std::string& name, bool navigable,
                                       std::optional<float> costMultiplier) {
    Surface surface;
    surface.info.name = name;
    surface.info.navigable = navigable;
    surface.info.costMultiplier = costMultiplier;
    m_surfaces.push_back(std::move(surface));
    return static_cast<int>(m_surfaces.size()) - 1;
}

TriangleSurfaceSampler::Surface* TriangleSurfaceSampler::getSurface(int surface) {
    if (surface < 0 || static_cast<size_t>(surface) >= m_surfaces.size()) {
        GRIDBUILD_WARN(std::format("Ignoring geometry for unknown surface index {}", surface));
        return nullptr;
    }
    return &m_surfaces[static_cast<size_t>(surface)];
}

void TriangleSurfaceSampler::addTriangle(int surface, const Vector3D& a, const Vector3D& b,
                                         const Vector3D& c) {
    Surface* s = getSurface(surface);
    if (!s) return;

    if (!s->hasBounds) {
        s->info.bounds = Bounds3D{a, a};
        s->hasBounds = true;
    }
    s->info.bounds.include(a);
    s->info.bounds.include(b);
    s->info.bounds.include(c);
    s->triangles.push_back(Triangle{a, b, c});
}

void TriangleSurfaceSampler::addQuad(int surface, const Vector3D& a, const Vector3D& b,
                                     const Vector3D& c, const Vector3D& d) {
    addTriangle(surface, a, b, c);
    addTriangle(surface, a, c, d);
}

int TriangleSurfaceSampler::addFloor(const std::string& name, float minX, float minZ,
                                     float maxX, float maxZ, float y, bool navigable,
                                     std::optional<float> costMultiplier) {
    int index = addSurface(name, navigable, costMultiplier);
    addQuad(index,
            Vector3D(minX, y, minZ), Vector3D(minX, y, maxZ),
            Vector3D(maxX, y, maxZ), Vector3D(maxX, y, minZ));
    return index;
}

std::vector<NavSurface> TriangleSurfaceSampler::surfaces() const {
    std::vector<NavSurface> result;
    result.reserve(m_surfaces.size());
    for (const auto& s : m_surfaces) {
        result.push_back(s.info);
    }
    return result;
}

size_t TriangleSurfaceSampler::getTriangleCount() const {
    size_t count = 0;
    for (const auto& s : m_surfaces) count += s.triangles.size();
    return count;
}

bool TriangleSurfaceSampler::intersect(const Vector3D& origin, const Vector3D& dir,
                                       const Triangle& tri, float& outT) {
    const Vector3D e1 = tri.b - tri.a;
    const Vector3D e2 = tri.c - tri.a;
    const Vector3D p = dir.cross(e2);
    const float det = e1.dot(p);
    if (std::fabs(det) < RAY_EPSILON) return false; // parallel to the plane

    const float invDet = 1.0f / det;
    const Vector3D s = origin - tri.a;
    const float u = s.dot(p) * invDet;
    if (u < 0.0f || u > 1.0f) return false;

    const Vector3D q = s.cross(e1);
    const float v = dir.dot(q) * invDet;
    if (v < 0.0f || u + v > 1.0f) return false;

    outT = e2.dot(q) * invDet;
    return outT >= 0.0f;
}

bool TriangleSurfaceSampler::raycast(const Vector3D& origin, const Vector3D& direction,
                                     float maxDistance, std::vector<RaycastHit>& outHits) const {
    outHits.clear();
    if (direction.lengthSquared() < 1e-12f || !(maxDistance >= 0.0f)) return false;

    const Vector3D dir = direction.normalized();
    for (size_t si = 0; si < m_surfaces.size(); ++si) {
        const Surface& surface = m_surfaces[si];
        if (!surface.info.navigable) continue;

        for (const auto& tri : surface.triangles) {
            float t = 0.0f;
            if (!intersect(origin, dir, tri, t) || t > maxDistance) continue;

            // Face the normal against the ray so that up-facing floors report +Y
            Vector3D normal = (tri.b - tri.a).cross(tri.c - tri.a).normalized();
            if (normal.dot(dir) > 0.0f) normal = normal * -1.0f;

            RaycastHit hit;
            hit.distance = t;
            hit.point = origin + dir * t;
            hit.normal = normal;
            hit.surfaceIndex = static_cast<int>(si);
            outHits.push_back(hit);
        }
    }

    std::stable_sort(outHits.begin(), outHits.end(),
                     [](const RaycastHit& a, const RaycastHit& b) { return a.distance < b.distance; });
    return !outHits.empty();
}

} // namespace Wayfinder
