module;
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <entt/entity/registry.hpp>

module Graphics:Camera.Impl;
import :Camera;
import Core;

namespace Graphics
{
    void ActiveCameras::Add(std::string_view name)
    {
        m_Cameras.try_emplace(std::string(name), std::nullopt);
    }

    void ActiveCameras::Set(std::string_view name, entt::entity entity)
    {
        m_Cameras.insert_or_assign(std::string(name), entity);
    }

    void ActiveCameras::Reset(std::string_view name)
    {
        if (auto it = m_Cameras.find(std::string(name)); it != m_Cameras.end())
            it->second.reset();
    }

    std::optional<entt::entity> ActiveCameras::Get(std::string_view name) const
    {
        if (auto it = m_Cameras.find(std::string(name)); it != m_Cameras.end())
            return it->second;
        return std::nullopt;
    }

    bool ActiveCameras::IsRegistered(std::string_view name) const
    {
        return m_Cameras.contains(std::string(name));
    }

    std::vector<std::string> ActiveCameras::GetNames() const
    {
        std::vector<std::string> names;
        names.reserve(m_Cameras.size());
        for (const auto& [name, entity] : m_Cameras)
            names.push_back(name);
        return names;
    }

    namespace
    {
        bool CarriesName(const entt::registry& registry, entt::entity entity, std::string_view name)
        {
            if (!registry.valid(entity))
                return false;
            const auto* camera = registry.try_get<ECS::Camera::Component>(entity);
            return camera && camera->Name && *camera->Name == name;
        }
    }

    void UpdateActiveCameras(const entt::registry& registry, ActiveCameras& activeCameras)
    {
        for (const std::string& name : activeCameras.GetNames())
        {
            if (auto bound = activeCameras.Get(name))
            {
                if (CarriesName(registry, *bound, name))
                    continue;

                Core::Log::Debug("ActiveCameras: '{}' lost its camera entity.", name);
                activeCameras.Reset(name);
            }

            auto view = registry.view<const ECS::Camera::Component>();
            for (auto entity : view)
            {
                const auto& camera = view.get<const ECS::Camera::Component>(entity);
                if (camera.Name && *camera.Name == name)
                {
                    activeCameras.Set(name, entity);
                    break;
                }
            }
        }
    }
}
