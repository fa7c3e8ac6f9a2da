module;
#include <cstdint>
#include <format>
#include <string>
#include <entt/entity/registry.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Components;

namespace ECS
{
    entt::entity Scene::CreateEntity(const std::string& name)
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, name);
        return e;
    }

    std::string DebugName(const entt::registry& registry, entt::entity entity)
    {
        const auto id = static_cast<uint32_t>(entt::to_integral(entity));
        if (registry.valid(entity))
        {
            if (const auto* tag = registry.try_get<Components::NameTag::Component>(entity))
                return std::format("'{}' (#{})", tag->Name, id);
        }
        return std::format("#{}", id);
    }
}
