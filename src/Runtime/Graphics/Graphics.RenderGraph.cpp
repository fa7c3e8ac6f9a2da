module;
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

module Graphics:RenderGraph.Impl;
import :RenderGraph;
import Core;
import RHI;

namespace Graphics
{
    ResourceSlots::ResourceSlots(std::span<const ResourceSlotInfo> infos)
    {
        m_Slots.reserve(infos.size());
        for (const auto& info : infos)
            m_Slots.push_back({.Info = info});
    }

    Core::Result ResourceSlots::Set(uint32_t index, RHI::RenderResourceId resource)
    {
        if (index >= m_Slots.size())
        {
            Core::Log::Error("ResourceSlots: slot index {} out of range ({} slots).", index, m_Slots.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        m_Slots[index].Resource = resource;
        return Core::Ok();
    }

    Core::Result ResourceSlots::Set(std::string_view name, RHI::RenderResourceId resource)
    {
        const auto index = FindIndex(name);
        if (!index)
        {
            Core::Log::Error("ResourceSlots: no slot named '{}'.", name);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }
        return Set(*index, resource);
    }

    const ResourceSlot* ResourceSlots::Get(uint32_t index) const
    {
        if (index >= m_Slots.size())
            return nullptr;
        return &m_Slots[index];
    }

    const ResourceSlot* ResourceSlots::Get(std::string_view name) const
    {
        const auto index = FindIndex(name);
        return index ? &m_Slots[*index] : nullptr;
    }

    std::optional<uint32_t> ResourceSlots::FindIndex(std::string_view name) const
    {
        for (uint32_t i = 0; i < m_Slots.size(); ++i)
        {
            if (m_Slots[i].Info.Name == name)
                return i;
        }
        return std::nullopt;
    }
}
