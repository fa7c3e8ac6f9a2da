module;
#include <string>
#include <string_view>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

import :Components;

export namespace ECS
{
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        entt::entity CreateEntity(const std::string& name);

        entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

        [[nodiscard]] size_t Size() const { return m_Registry.storage<entt::entity>()->size(); }

    private:
        entt::registry m_Registry;
    };

    // Name for log lines: the NameTag if present, otherwise the raw entity id.
    [[nodiscard]] std::string DebugName(const entt::registry& registry, entt::entity entity);
}
