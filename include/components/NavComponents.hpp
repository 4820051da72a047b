/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAV_COMPONENTS_HPP
#define NAV_COMPONENTS_HPP

/**
 * @file NavComponents.hpp
 * @brief Authorable scene components that feed a NavigationManager
 *
 * NavMeshComponent hands the scene surfaces to the manager and builds the grid.
 * NavLinkComponent registers one off-mesh link. Components can initialize in
 * any order: a link initialized before the mesh is queued and applied when the
 * grid is built.
 */

#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <variant>
#include <vector>
#include "ai/navigation/NavigationTypes.hpp"
#include "ai/navigation/SurfaceSampler.hpp"
#include "utils/Vector3D.hpp"

namespace Wayfinder {

class NavigationManager;

enum class NavComponentType { NAV_MESH, NAV_LINK };

inline std::ostream& operator<<(std::ostream& os, const NavComponentType& type) {
    switch (type) {
        case NavComponentType::NAV_MESH: return os << "NavMesh";
        case NavComponentType::NAV_LINK: return os << "NavLink";
        default: return os << "UNKNOWN";
    }
}

// Accepts "NavMesh", "navmesh", "NavLink" and "navlink"
std::optional<NavComponentType> navComponentTypeFromName(std::string_view name);

struct NavMeshParams {
    std::vector<NavSurface> surfaces;
    std::shared_ptr<const ISurfaceSampler> sampler;
};

struct NavLinkParams {
    Vector3D from;
    Vector3D to;
    bool bidirectional{true};
    std::optional<float> cost;
};

using NavComponentParams = std::variant<NavMeshParams, NavLinkParams>;

class NavComponent {
public:
    virtual ~NavComponent() = default;

    NavComponent(const NavComponent&) = delete;
    NavComponent& operator=(const NavComponent&) = delete;

    virtual NavComponentType getType() const = 0;

    /**
     * @brief Applies the component to a navigation manager
     * @return true if the component is now in effect (or queued to be)
     */
    virtual bool initialize(NavigationManager& manager) = 0;

    bool isInitialized() const { return m_initialized; }

protected:
    NavComponent() = default;
    bool m_initialized{false};
};

class NavMeshComponent : public NavComponent {
public:
    explicit NavMeshComponent(NavMeshParams params) : m_params(std::move(params)) {}

    NavComponentType getType() const override { return NavComponentType::NAV_MESH; }
    bool initialize(NavigationManager& manager) override;

    // Grid was built on the last initialize()
    bool isLoaded() const { return m_loaded; }

private:
    NavMeshParams m_params;
    bool m_loaded{false};
};

class NavLinkComponent : public NavComponent {
public:
    explicit NavLinkComponent(NavLinkParams params) : m_params(std::move(params)) {}

    NavComponentType getType() const override { return NavComponentType::NAV_LINK; }
    bool initialize(NavigationManager& manager) override;

    std::optional<LinkRegistration> getRegistration() const { return m_registration; }
    const NavLinkParams& getParams() const { return m_params; }

private:
    NavLinkParams m_params;
    std::optional<LinkRegistration> m_registration;
};

} // namespace Wayfinder

#endif // NAV_COMPONENTS_HPP
