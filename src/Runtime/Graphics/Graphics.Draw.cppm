module;
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

export module Graphics:Draw;

import RHI;

export namespace Graphics::Commands
{
    struct SetPipeline
    {
        RHI::PipelineHandle Pipeline{};
    };

    struct DrawIndexed
    {
        int32_t BaseVertex = 0;
        RHI::Range Indices{};
        RHI::Range Instances{0, 1};
    };

    struct SetVertexBuffer
    {
        uint32_t Slot = 0;
        RHI::BufferId Buffer{};
        uint64_t Offset = 0;
    };

    struct SetIndexBuffer
    {
        RHI::BufferId Buffer{};
        uint64_t Offset = 0;
    };

    struct SetBindGroup
    {
        uint32_t Index = 0;
        RHI::BindGroupId BindGroup{};
        std::optional<std::vector<uint32_t>> DynamicUniformIndices{};
    };
}

export namespace Graphics
{
    using RenderCommand = std::variant<Commands::SetPipeline,
                                       Commands::DrawIndexed,
                                       Commands::SetVertexBuffer,
                                       Commands::SetIndexBuffer,
                                       Commands::SetBindGroup>;

    [[nodiscard]] constexpr std::string_view CommandName(const RenderCommand& command)
    {
        switch (command.index())
        {
        case 0: return "SetPipeline";
        case 1: return "DrawIndexed";
        case 2: return "SetVertexBuffer";
        case 3: return "SetIndexBuffer";
        default: return "SetBindGroup";
        }
    }
}

export namespace ECS::Draw
{
    // Declarative draw stream of one entity. Commands are replayed in order by
    // the main pass; producers are expected to set a pipeline before anything
    // that depends on its layout.
    struct Component
    {
        bool IsVisible = true;
        std::vector<Graphics::RenderCommand> RenderCommands{};

        void SetPipeline(RHI::PipelineHandle pipeline)
        {
            RenderCommands.emplace_back(Graphics::Commands::SetPipeline{pipeline});
        }

        void SetVertexBuffer(uint32_t slot, RHI::BufferId buffer, uint64_t offset = 0)
        {
            RenderCommands.emplace_back(Graphics::Commands::SetVertexBuffer{slot, buffer, offset});
        }

        void SetIndexBuffer(RHI::BufferId buffer, uint64_t offset = 0)
        {
            RenderCommands.emplace_back(Graphics::Commands::SetIndexBuffer{buffer, offset});
        }

        void SetBindGroup(uint32_t index, RHI::BindGroupId bindGroup,
                          std::optional<std::vector<uint32_t>> dynamicUniformIndices = std::nullopt)
        {
            RenderCommands.emplace_back(Graphics::Commands::SetBindGroup{index, bindGroup, std::move(dynamicUniformIndices)});
        }

        void DrawIndexed(RHI::Range indices, int32_t baseVertex = 0, RHI::Range instances = {0, 1})
        {
            RenderCommands.emplace_back(Graphics::Commands::DrawIndexed{baseVertex, indices, instances});
        }

        void Clear() { RenderCommands.clear(); }
    };
}
