/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "components/NavComponents.hpp"
#include "managers/NavigationManager.hpp"

namespace Wayfinder {

std::optional<NavComponentType> navComponentTypeFromName(std::string_view name) {
    if (name == "NavMesh" || name == "navmesh") return NavComponentType::NAV_MESH;
    if (name == "NavLink" || name == "navlink") return NavComponentType::NAV_LINK;
    return std::nullopt;
}

bool NavMeshComponent::initialize(NavigationManager& manager) {
    m_loaded = manager.init(m_params.surfaces, m_params.sampler);
    m_initialized = true;
    return m_loaded;
}

bool NavLinkComponent::initialize(NavigationManager& manager) {
    m_registration = manager.registerLink(m_params.from, m_params.to, m_params.bidirectional,
                                          m_params.cost);
    m_initialized = true;
    return *m_registration != LinkRegistration::DROPPED_INVALID_ENDPOINT;
}

} // namespace Wayfinder
