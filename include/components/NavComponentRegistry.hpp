/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAV_COMPONENT_REGISTRY_HPP
#define NAV_COMPONENT_REGISTRY_HPP

/**
 * @file NavComponentRegistry.hpp
 * @brief Owning container and factory for the navigation components of a scene
 *
 * The NavComponentRegistry provides:
 * - Creation by NavComponentType, or by authored name, with typed parameters
 * - Typed retrieval via get<T>() / count<T>()
 * - Initialization of every component against a manager, in creation order
 *
 * Usage:
 * @code
 * NavComponentRegistry components;
 * components.create("NavLink", NavLinkParams{a, b});      // queued until the mesh loads
 * components.create("NavMesh", NavMeshParams{surfaces, sampler});
 * components.initializeAll(navigationManager);
 * @endcode
 */

#include <memory>
#include <string_view>
#include <type_traits>
#include <vector>
#include "components/NavComponents.hpp"

namespace Wayfinder {

class NavigationManager;

class NavComponentRegistry
{
public:
    NavComponentRegistry() = default;
    ~NavComponentRegistry() = default;

    // Non-copyable (owns components)
    NavComponentRegistry(const NavComponentRegistry&) = delete;
    NavComponentRegistry& operator=(const NavComponentRegistry&) = delete;

    // Movable
    NavComponentRegistry(NavComponentRegistry&&) noexcept = default;
    NavComponentRegistry& operator=(NavComponentRegistry&&) noexcept = default;

    /**
     * @brief Add a component of type T
     * @tparam T Component type (must derive from NavComponent)
     * @param args Arguments forwarded to T's constructor
     * @return Reference to the created component
     */
    template<typename T, typename... Args>
    T& add(Args&&... args)
    {
        static_assert(std::is_base_of_v<NavComponent, T>,
            "T must derive from NavComponent");

        auto component = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *component;
        m_components.push_back(std::move(component));
        return ref;
    }

    /**
     * @brief Create a component from its type and parameters
     * @return The component, or nullptr if params do not match the type
     */
    NavComponent* create(NavComponentType type, NavComponentParams params);

    /**
     * @brief Create a component from an authored type name
     * @return The component, or nullptr for an unknown name or mismatched params
     */
    NavComponent* create(std::string_view typeName, NavComponentParams params);

    /**
     * @brief First component of type T, or nullptr
     */
    template<typename T>
    T* get()
    {
        static_assert(std::is_base_of_v<NavComponent, T>,
            "T must derive from NavComponent");

        for (auto& component : m_components) {
            if (auto* typed = dynamic_cast<T*>(component.get())) {
                return typed;
            }
        }
        return nullptr;
    }

    template<typename T>
    const T* get() const
    {
        return const_cast<NavComponentRegistry*>(this)->get<T>();
    }

    template<typename T>
    [[nodiscard]] size_t count() const
    {
        size_t n = 0;
        for (const auto& component : m_components) {
            if (dynamic_cast<const T*>(component.get())) ++n;
        }
        return n;
    }

    /**
     * @brief Initialize every component not yet initialized, in creation order
     * @return Number of components whose initialize() reported failure
     */
    size_t initializeAll(NavigationManager& manager);

    [[nodiscard]] size_t size() const { return m_components.size(); }
    [[nodiscard]] bool empty() const { return m_components.empty(); }
    void clear() { m_components.clear(); }

private:
    std::vector<std::unique_ptr<NavComponent>> m_components;
};

} // namespace Wayfinder

#endif // NAV_COMPONENT_REGISTRY_HPP
