/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_SMOOTHER_HPP
#define PATH_SMOOTHER_HPP

#include <vector>
#include <cmath>
#include "utils/Vector3D.hpp"

namespace Wayfinder {

struct PathSmoother {
    // Drops interior points whose horizontal turn against their original
    // neighbors is below the cosine threshold; single pass, endpoints kept
    static void simplify(std::vector<Vector3D>& path, float cosThreshold) {
        if (path.size() < 3) return;
        std::vector<Vector3D> out;
        out.reserve(path.size());
        out.push_back(path.front());
        for (size_t i = 1; i + 1 < path.size(); ++i) {
            const Vector3D& a = path[i - 1];
            const Vector3D& b = path[i];
            const Vector3D& c = path[i + 1];
            float abx = b.getX() - a.getX(), abz = b.getZ() - a.getZ();
            float bcx = c.getX() - b.getX(), bcz = c.getZ() - b.getZ();
            float lenAB = std::sqrt(abx * abx + abz * abz);
            float lenBC = std::sqrt(bcx * bcx + bcz * bcz);
            if (lenAB < 1e-6f || lenBC < 1e-6f) continue; // degenerate segment

            float cosine = (abx * bcx + abz * bcz) / (lenAB * lenBC);
            if (cosine <= cosThreshold) {
                out.push_back(b);
            }
        }
        out.push_back(path.back());
        path.swap(out);
    }
};

} // namespace Wayfinder

#endif // PATH_SMOOTHER_HPP
