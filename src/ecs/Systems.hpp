#pragma once

#include "ecs/Registry.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace neta {

/// System execution phase.
/// All phases run on the main thread in the order listed.
enum class SystemPhase {
    PreUpdate,      // Picking and pointer event dispatch
    Update,         // Frame setup, asset reloads
    PostUpdate,     // Control handle tracking
    Render,         // World sprites
    PostRender,     // Overlay: borders, handles, gizmos
};

constexpr size_t SYSTEM_PHASE_COUNT = 5;

/// Base class for all ECS systems
class System {
public:
    explicit System(const std::string& name, int priority = 0)
        : m_name(name), m_priority(priority) {}
    virtual ~System() = default;

    // Non-copyable
    System(const System&) = delete;
    System& operator=(const System&) = delete;

    /// Called once when the system is added to a scheduler
    virtual void init(Registry& registry) {
        m_registry = &registry;
    }

    /// Called every frame while enabled
    virtual void update(float dt) = 0;

    virtual void shutdown() {}

    const std::string& getName() const { return m_name; }

    /// Execution order inside a phase (lower = earlier)
    int getPriority() const { return m_priority; }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

protected:
    Registry& getRegistry() { return *m_registry; }

private:
    std::string m_name;
    int m_priority = 0;
    bool m_enabled = true;
    Registry* m_registry = nullptr;
};

/// Owns the systems and runs them phase by phase
class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;

    void init(Registry& registry) {
        m_registry = &registry;
    }

    /// Construct a system in place and add it to a phase
    template<typename T, typename... Args>
    T* addSystem(SystemPhase phase, Args&&... args) {
        auto system = std::make_unique<T>(std::forward<Args>(args)...);
        T* ptr = system.get();
        addSystem(phase, std::move(system));
        return ptr;
    }

    void addSystem(SystemPhase phase, std::unique_ptr<System> system) {
        system->init(*m_registry);
        auto& systems = m_phases[index(phase)];
        systems.push_back(std::move(system));
        std::stable_sort(systems.begin(), systems.end(),
            [](const auto& a, const auto& b) {
                return a->getPriority() < b->getPriority();
            });
    }

    /// First system of the given type, or nullptr
    template<typename T>
    T* getSystem() {
        for (auto& systems : m_phases) {
            for (auto& system : systems) {
                if (T* typed = dynamic_cast<T*>(system.get())) {
                    return typed;
                }
            }
        }
        return nullptr;
    }

    System* getSystem(const std::string& name) {
        for (auto& systems : m_phases) {
            for (auto& system : systems) {
                if (system->getName() == name) {
                    return system.get();
                }
            }
        }
        return nullptr;
    }

    void runPhase(SystemPhase phase, float dt) {
        for (auto& system : m_phases[index(phase)]) {
            if (system->isEnabled()) {
                system->update(dt);
            }
        }
    }

    /// PreUpdate, Update, PostUpdate
    void update(float dt) {
        runPhase(SystemPhase::PreUpdate, dt);
        runPhase(SystemPhase::Update, dt);
        runPhase(SystemPhase::PostUpdate, dt);
    }

    /// Render, PostRender
    void render(float dt) {
        runPhase(SystemPhase::Render, dt);
        runPhase(SystemPhase::PostRender, dt);
    }

    void shutdown() {
        for (auto& systems : m_phases) {
            for (auto& system : systems) {
                system->shutdown();
            }
            systems.clear();
        }
    }

    size_t getSystemCount(SystemPhase phase) const {
        return m_phases[index(phase)].size();
    }

    size_t getTotalSystemCount() const {
        size_t total = 0;
        for (const auto& systems : m_phases) {
            total += systems.size();
        }
        return total;
    }

private:
    static size_t index(SystemPhase phase) { return static_cast<size_t>(phase); }

    std::array<std::vector<std::unique_ptr<System>>, SYSTEM_PHASE_COUNT> m_phases;
    Registry* m_registry = nullptr;
};

} // namespace neta
