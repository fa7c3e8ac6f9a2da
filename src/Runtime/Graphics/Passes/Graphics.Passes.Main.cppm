module;

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <entt/entity/registry.hpp>

export module Graphics:Passes.Main;

import :RenderGraph;
import :Pipeline;
import :Draw;
import :DrawState;
import :Camera;
import Core;
import RHI;

export namespace Graphics::Passes
{
    // -----------------------------------------------------------------
    // MainPassNode
    // -----------------------------------------------------------------
    // Opens one backend pass per active camera and replays the Draw
    // command stream of every visible entity into it.
    //
    // Attachments declared as RHI::AttachmentInput become texture inputs
    // of the node (color attachments first, then depth-stencil) and are
    // re-resolved from the input slots every frame.
    //
    // Draws whose pipeline bindings are incomplete are dropped with a
    // warning. Everything else that is wrong with the command stream or
    // the scene aborts the node for this frame.
    class MainPassNode final : public IRenderGraphNode
    {
    public:
        struct Config
        {
            bool LogDroppedDraws = true;
            bool TraceCommands = false;
        };

        // Reset at the start of every Update.
        struct FrameStats
        {
            uint32_t PassesBegun = 0;
            uint32_t EntitiesDrawn = 0;
            uint32_t EntitiesSkipped = 0;
            uint32_t CommandsReplayed = 0;
            uint32_t DrawsIssued = 0;
            uint32_t DrawsDropped = 0;
        };

        explicit MainPassNode(RHI::PassDescriptor descriptor);
        MainPassNode(RHI::PassDescriptor descriptor, Config config);

        // Cameras render in the order they were added.
        void AddCamera(std::string_view cameraName);
        [[nodiscard]] std::span<const std::string> GetCameras() const { return m_Cameras; }

        [[nodiscard]] std::span<const ResourceSlotInfo> Input() const override { return m_Inputs; }

        [[nodiscard]] Core::Result Update(const entt::registry& world,
                                          const RenderResources& resources,
                                          RHI::IRenderContext& renderContext,
                                          const ResourceSlots& input,
                                          ResourceSlots& output) override;

        [[nodiscard]] const RHI::PassDescriptor& GetDescriptor() const { return m_Descriptor; }
        [[nodiscard]] const FrameStats& GetLastFrameStats() const { return m_Stats; }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        RHI::PassDescriptor m_Descriptor;
        Config m_Config;

        std::vector<ResourceSlotInfo> m_Inputs;
        std::vector<std::string> m_Cameras;

        // Per color attachment: input slot index, or empty for literal textures.
        std::vector<std::optional<uint32_t>> m_ColorAttachmentInputIndices;
        std::optional<uint32_t> m_DepthStencilAttachmentInputIndex;

        FrameStats m_Stats;

        [[nodiscard]] Core::Result ResolveAttachments(const ResourceSlots& input);
        [[nodiscard]] Core::Expected<RHI::TextureId> ResolveTexture(const ResourceSlots& input, uint32_t index) const;

        [[nodiscard]] Core::Result RecordCamera(RHI::IRenderPass& pass,
                                                const entt::registry& world,
                                                const PipelineStore& pipelines,
                                                const ECS::VisibleEntities::Component& visibleEntities,
                                                std::string_view cameraName);

        // Validates and updates drawState and issues the backend call for one command.
        [[nodiscard]] Core::Result ReplayCommand(RHI::IRenderPass& pass,
                                                 DrawState& drawState,
                                                 const PipelineStore& pipelines,
                                                 const RenderCommand& command);

        [[nodiscard]] Core::Result ReplaySetBindGroup(RHI::IRenderPass& pass,
                                                      DrawState& drawState,
                                                      const PipelineStore& pipelines,
                                                      const Commands::SetBindGroup& command);
    };
}
