/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "components/NavComponentRegistry.hpp"
#include <format>
#include <sstream>
#include <string>
#include "core/Logger.hpp"
#include "managers/NavigationManager.hpp"

namespace Wayfinder {

namespace {
std::string typeName(NavComponentType type) {
    std::ostringstream os;
    os << type;
    return os.str();
}
}

NavComponent* NavComponentRegistry::create(NavComponentType type, NavComponentParams params) {
    switch (type) {
        case NavComponentType::NAV_MESH:
            if (auto* mesh = std::get_if<NavMeshParams>(&params)) {
                return &add<NavMeshComponent>(std::move(*mesh));
            }
            break;
        case NavComponentType::NAV_LINK:
            if (auto* link = std::get_if<NavLinkParams>(&params)) {
                return &add<NavLinkComponent>(std::move(*link));
            }
            break;
    }

    COMPONENT_ERROR(std::format("Parameters do not match component type {}", typeName(type)));
    return nullptr;
}

NavComponent* NavComponentRegistry::create(std::string_view name, NavComponentParams params) {
    auto type = navComponentTypeFromName(name);
    if (!type) {
        COMPONENT_ERROR(std::format("Unknown navigation component type '{}'", name));
        return nullptr;
    }
    return create(*type, std::move(params));
}

size_t NavComponentRegistry::initializeAll(NavigationManager& manager) {
    size_t failures = 0;
    for (auto& component : m_components) {
        if (component->isInitialized()) continue;
        if (!component->initialize(manager)) {
            COMPONENT_WARN(std::format("{} component did not initialize", typeName(component->getType())));
            ++failures;
        }
    }
    COMPONENT_DEBUG(std::format("Initialized {} navigation components, {} failed",
                    m_components.size(), failures));
    return failures;
}

} // namespace Wayfinder
