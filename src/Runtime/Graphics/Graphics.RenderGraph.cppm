module;
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <entt/entity/registry.hpp>

export module Graphics:RenderGraph;

import :Camera;
import :Pipeline;
import Core;
import RHI;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // Resource slots
    // -------------------------------------------------------------------------
    // A node declares its inputs/outputs as an ordered list of ResourceSlotInfo.
    // The scheduler hands it a ResourceSlots object with the same order, filled
    // with whatever upstream nodes produced this frame.
    struct ResourceSlotInfo
    {
        std::string Name;
        RHI::RenderResourceType ResourceType = RHI::RenderResourceType::Texture;

        bool operator==(const ResourceSlotInfo&) const = default;
    };

    struct ResourceSlot
    {
        ResourceSlotInfo Info;
        std::optional<RHI::RenderResourceId> Resource{};
    };

    class ResourceSlots
    {
    public:
        ResourceSlots() = default;
        explicit ResourceSlots(std::span<const ResourceSlotInfo> infos);

        [[nodiscard]] Core::Result Set(uint32_t index, RHI::RenderResourceId resource);
        [[nodiscard]] Core::Result Set(std::string_view name, RHI::RenderResourceId resource);

        // nullptr if index is out of range.
        [[nodiscard]] const ResourceSlot* Get(uint32_t index) const;
        [[nodiscard]] const ResourceSlot* Get(std::string_view name) const;

        [[nodiscard]] std::optional<uint32_t> FindIndex(std::string_view name) const;

        [[nodiscard]] uint32_t Size() const { return static_cast<uint32_t>(m_Slots.size()); }
        [[nodiscard]] bool Empty() const { return m_Slots.empty(); }

        [[nodiscard]] auto begin() const { return m_Slots.begin(); }
        [[nodiscard]] auto end() const { return m_Slots.end(); }

    private:
        std::vector<ResourceSlot> m_Slots;
    };

    // ---------------------------------------------------------------------
    // Frame resources
    // ---------------------------------------------------------------------
    // Read-only shared state a node may consult during Update. Nothing here is
    // owned by the node and nothing may be cached across frames.
    struct RenderResources
    {
        const ActiveCameras& Cameras;
        const PipelineStore& Pipelines;
        const RHI::RenderResourceBindings& Bindings;
    };

    // ---------------------------------------------------------------------
    // Render graph node interface
    // ---------------------------------------------------------------------
    class IRenderGraphNode
    {
    public:
        virtual ~IRenderGraphNode() = default;

        [[nodiscard]] virtual std::span<const ResourceSlotInfo> Input() const { return {}; }
        [[nodiscard]] virtual std::span<const ResourceSlotInfo> Output() const { return {}; }

        // Called once per frame, after every producer of Input() has run.
        // An error aborts this node for the frame.
        [[nodiscard]] virtual Core::Result Update(const entt::registry& world,
                                                  const RenderResources& resources,
                                                  RHI::IRenderContext& renderContext,
                                                  const ResourceSlots& input,
                                                  ResourceSlots& output) = 0;
    };
}
