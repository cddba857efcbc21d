#pragma once

#include <entt/entt.hpp>

#include <vector>
#include <string>
#include <cstdint>

namespace neta {

/// Entity handle - wrapper around EnTT entity for convenience
using Entity = entt::entity;

/// Null entity constant
constexpr Entity NullEntity = entt::null;

/// Readable entity id for logs and debug output ("12v0")
inline std::string entityLabel(Entity entity) {
    if (entity == NullEntity) return "null";
    return std::to_string(entt::to_entity(entity)) + "v" + std::to_string(entt::to_version(entity));
}

/// Entity registry wrapper providing convenient access to EnTT functionality
class Registry {
public:
    Registry() = default;
    ~Registry() = default;

    // Non-copyable, movable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    Entity create() {
        return m_registry.create();
    }

    /// Create a new entity with given components
    template<typename... Components>
    Entity create(Components&&... components) {
        Entity entity = m_registry.create();
        (m_registry.emplace<std::decay_t<Components>>(entity, std::forward<Components>(components)), ...);
        return entity;
    }

    /// Destroy an entity (no-op for invalid handles)
    void destroy(Entity entity) {
        if (valid(entity)) {
            m_registry.destroy(entity);
        }
    }

    bool valid(Entity entity) const {
        return entity != NullEntity && m_registry.valid(entity);
    }

    template<typename Component, typename... Args>
    Component& add(Entity entity, Args&&... args) {
        return m_registry.emplace<Component>(entity, std::forward<Args>(args)...);
    }

    template<typename Component, typename... Args>
    Component& addOrReplace(Entity entity, Args&&... args) {
        return m_registry.emplace_or_replace<Component>(entity, std::forward<Args>(args)...);
    }

    /// Remove a component if present
    template<typename Component>
    void remove(Entity entity) {
        if (valid(entity)) {
            m_registry.remove<Component>(entity);
        }
    }

    /// Get a component from an entity (returns nullptr if not present)
    template<typename Component>
    Component* tryGet(Entity entity) {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    template<typename Component>
    const Component* tryGet(Entity entity) const {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    /// Get a component from an entity (assumes it exists)
    template<typename Component>
    Component& get(Entity entity) {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    const Component& get(Entity entity) const {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    bool has(Entity entity) const {
        return valid(entity) && m_registry.all_of<Component>(entity);
    }

    template<typename... Components>
    bool hasAll(Entity entity) const {
        return valid(entity) && m_registry.all_of<Components...>(entity);
    }

    template<typename... Components>
    bool hasAny(Entity entity) const {
        return valid(entity) && m_registry.any_of<Components...>(entity);
    }

    template<typename... Components>
    auto view() {
        return m_registry.view<Components...>();
    }

    template<typename... Components>
    auto view() const {
        return m_registry.view<Components...>();
    }

    /// Iterate over all entities with specified components
    template<typename... Components, typename Func>
    void each(Func&& func) {
        m_registry.view<Components...>().each(std::forward<Func>(func));
    }

    /// Get count of entities with specific components
    template<typename... Components>
    size_t count() const {
        size_t n = 0;
        for ([[maybe_unused]] auto entity : m_registry.view<Components...>()) {
            ++n;
        }
        return n;
    }

    /// All alive entities, in storage order
    std::vector<Entity> allEntities() const {
        std::vector<Entity> results;
        for (auto [entity] : m_registry.storage<entt::entity>()->each()) {
            results.push_back(entity);
        }
        return results;
    }

    void clear() {
        m_registry.clear();
    }

    entt::registry& raw() { return m_registry; }
    const entt::registry& raw() const { return m_registry; }

    /// Find first entity matching a predicate
    template<typename... Components, typename Func>
    Entity findFirst(Func&& predicate) {
        for (auto entity : m_registry.view<Components...>()) {
            if (predicate(entity)) {
                return entity;
            }
        }
        return NullEntity;
    }

    /// Collect all entities with specified components.
    /// Use this instead of a view when the loop body adds or removes them.
    template<typename... Components>
    std::vector<Entity> collect() const {
        std::vector<Entity> results;
        for (auto entity : m_registry.view<Components...>()) {
            results.push_back(entity);
        }
        return results;
    }

private:
    entt::registry m_registry;
};

} // namespace neta
