module;

#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module Graphics:Passes.Main.Impl;

import :Passes.Main;
import :RenderGraph;
import :Pipeline;
import :Draw;
import :DrawState;
import :Camera;
import Core;
import ECS;
import RHI;

namespace Graphics::Passes
{
    namespace
    {
        std::string PipelineName(std::optional<RHI::PipelineHandle> pipeline)
        {
            return pipeline ? std::format("{}", *pipeline) : std::string("<none>");
        }
    }

    MainPassNode::MainPassNode(RHI::PassDescriptor descriptor)
        : MainPassNode(std::move(descriptor), Config{})
    {
    }

    MainPassNode::MainPassNode(RHI::PassDescriptor descriptor, Config config)
        : m_Descriptor(std::move(descriptor)), m_Config(config)
    {
        m_ColorAttachmentInputIndices.reserve(m_Descriptor.ColorAttachments.size());
        for (const auto& color : m_Descriptor.ColorAttachments)
        {
            if (const auto* input = std::get_if<RHI::AttachmentInput>(&color.Attachment))
            {
                m_Inputs.push_back({.Name = input->Name, .ResourceType = RHI::RenderResourceType::Texture});
                m_ColorAttachmentInputIndices.emplace_back(static_cast<uint32_t>(m_Inputs.size() - 1));
            }
            else
            {
                m_ColorAttachmentInputIndices.emplace_back(std::nullopt);
            }
        }

        if (m_Descriptor.DepthStencilAttachment)
        {
            if (const auto* input = std::get_if<RHI::AttachmentInput>(&m_Descriptor.DepthStencilAttachment->Attachment))
            {
                m_Inputs.push_back({.Name = input->Name, .ResourceType = RHI::RenderResourceType::Texture});
                m_DepthStencilAttachmentInputIndex = static_cast<uint32_t>(m_Inputs.size() - 1);
            }
        }
    }

    void MainPassNode::AddCamera(std::string_view cameraName)
    {
        m_Cameras.emplace_back(cameraName);
    }

    Core::Result MainPassNode::Update(const entt::registry& world,
                                      const RenderResources& resources,
                                      RHI::IRenderContext& renderContext,
                                      const ResourceSlots& input,
                                      ResourceSlots& output)
    {
        (void)output;
        m_Stats = {};

        if (auto resolved = ResolveAttachments(input); !resolved)
            return resolved;

        for (const std::string& cameraName : m_Cameras)
        {
            const std::optional<entt::entity> cameraEntity = resources.Cameras.Get(cameraName);
            if (!cameraEntity)
                continue;

            const auto* visibleEntities = world.valid(*cameraEntity)
                ? world.try_get<ECS::VisibleEntities::Component>(*cameraEntity)
                : nullptr;
            if (!visibleEntities)
            {
                Core::Log::Error("MainPassNode: active camera '{}' ({}) has no VisibleEntities component.",
                                 cameraName, ECS::DebugName(world, *cameraEntity));
                return Core::Err(Core::ErrorCode::InvalidState);
            }

            ++m_Stats.PassesBegun;
            auto recorded = renderContext.BeginPass(m_Descriptor, resources.Bindings,
                [&](RHI::IRenderPass& pass)
                {
                    return RecordCamera(pass, world, resources.Pipelines, *visibleEntities, cameraName);
                });

            if (!recorded)
            {
                Core::Log::Error("MainPassNode: pass for camera '{}' failed: {}.",
                                 cameraName, recorded.error());
                return recorded;
            }
        }

        return Core::Ok();
    }

    // -----------------------------------------------------------------
    // Resource slot resolution
    // -----------------------------------------------------------------

    Core::Expected<RHI::TextureId> MainPassNode::ResolveTexture(const ResourceSlots& input, uint32_t index) const
    {
        const std::string_view name = m_Inputs[index].Name;

        const ResourceSlot* slot = input.Get(index);
        if (!slot || !slot->Resource)
        {
            Core::Log::Error("MainPassNode: no resource supplied for input slot {} ('{}').", index, name);
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        }

        const std::optional<RHI::TextureId> texture = RHI::GetTexture(*slot->Resource);
        if (!texture)
        {
            Core::Log::Error("MainPassNode: input slot {} ('{}') holds a {}, expected a Texture.",
                             index, name, RHI::ResourceTypeToString(RHI::GetResourceType(*slot->Resource)));
            return std::unexpected(Core::ErrorCode::TypeMismatch);
        }

        return *texture;
    }

    Core::Result MainPassNode::ResolveAttachments(const ResourceSlots& input)
    {
        for (size_t i = 0; i < m_Descriptor.ColorAttachments.size(); ++i)
        {
            const std::optional<uint32_t> inputIndex = m_ColorAttachmentInputIndices[i];
            if (!inputIndex)
                continue;

            auto texture = ResolveTexture(input, *inputIndex);
            if (!texture)
                return Core::Err(texture.error());

            m_Descriptor.ColorAttachments[i].Attachment = *texture;
        }

        if (m_DepthStencilAttachmentInputIndex)
        {
            auto texture = ResolveTexture(input, *m_DepthStencilAttachmentInputIndex);
            if (!texture)
                return Core::Err(texture.error());

            m_Descriptor.DepthStencilAttachment->Attachment = *texture;
        }

        return Core::Ok();
    }

    // -----------------------------------------------------------------
    // Command replay
    // -----------------------------------------------------------------

    Core::Result MainPassNode::RecordCamera(RHI::IRenderPass& pass,
                                            const entt::registry& world,
                                            const PipelineStore& pipelines,
                                            const ECS::VisibleEntities::Component& visibleEntities,
                                            std::string_view cameraName)
    {
        // Bindings never carry over from a previous pass.
        DrawState drawState;

        for (const auto& visible : visibleEntities)
        {
            const auto* draw = world.valid(visible.Entity)
                ? world.try_get<ECS::Draw::Component>(visible.Entity)
                : nullptr;

            if (!draw || !draw->IsVisible)
            {
                ++m_Stats.EntitiesSkipped;
                continue;
            }

            ++m_Stats.EntitiesDrawn;

            for (const RenderCommand& command : draw->RenderCommands)
            {
                if (auto replayed = ReplayCommand(pass, drawState, pipelines, command); !replayed)
                {
                    Core::Log::Error("MainPassNode: camera '{}' aborted at {} of entity {}.",
                                     cameraName, CommandName(command), ECS::DebugName(world, visible.Entity));
                    return replayed;
                }
            }
        }

        return Core::Ok();
    }

    Core::Result MainPassNode::ReplayCommand(RHI::IRenderPass& pass,
                                             DrawState& drawState,
                                             const PipelineStore& pipelines,
                                             const RenderCommand& command)
    {
        if (m_Config.TraceCommands)
            Core::Log::Debug("MainPassNode: {}", CommandName(command));

        Core::Result result = std::visit([&](const auto& cmd) -> Core::Result
        {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, Commands::SetPipeline>)
            {
                auto descriptor = pipelines.Get(cmd.Pipeline);
                if (!descriptor)
                {
                    Core::Log::Error("MainPassNode: pipeline {} is not loaded.", cmd.Pipeline);
                    return Core::Err(Core::ErrorCode::AssetNotLoaded);
                }

                if (auto bound = drawState.SetPipeline(cmd.Pipeline, **descriptor); !bound)
                    return bound;

                pass.SetPipeline(cmd.Pipeline);
                return Core::Ok();
            }
            else if constexpr (std::is_same_v<T, Commands::DrawIndexed>)
            {
                if (!drawState.CanDrawIndexed())
                {
                    ++m_Stats.DrawsDropped;
                    if (m_Config.LogDroppedDraws)
                    {
                        Core::Log::Warn("MainPassNode: dropped indexed draw, pipeline layout not fully bound for pipeline {}.",
                                        PipelineName(drawState.GetPipeline()));
                    }
                    return Core::Ok();
                }

                pass.DrawIndexed(cmd.Indices, cmd.BaseVertex, cmd.Instances);
                ++m_Stats.DrawsIssued;
                return Core::Ok();
            }
            else if constexpr (std::is_same_v<T, Commands::SetVertexBuffer>)
            {
                if (auto bound = drawState.SetVertexBuffer(cmd.Slot, cmd.Buffer); !bound)
                    return bound;

                pass.SetVertexBuffer(cmd.Slot, cmd.Buffer, cmd.Offset);
                return Core::Ok();
            }
            else if constexpr (std::is_same_v<T, Commands::SetIndexBuffer>)
            {
                drawState.SetIndexBuffer(cmd.Buffer);
                pass.SetIndexBuffer(cmd.Buffer, cmd.Offset);
                return Core::Ok();
            }
            else
            {
                static_assert(std::is_same_v<T, Commands::SetBindGroup>, "Unhandled RenderCommand alternative");
                return ReplaySetBindGroup(pass, drawState, pipelines, cmd);
            }
        }, command);

        if (result)
            ++m_Stats.CommandsReplayed;
        return result;
    }

    Core::Result MainPassNode::ReplaySetBindGroup(RHI::IRenderPass& pass,
                                                  DrawState& drawState,
                                                  const PipelineStore& pipelines,
                                                  const Commands::SetBindGroup& command)
    {
        const std::optional<RHI::PipelineHandle> pipeline = drawState.GetPipeline();
        if (!pipeline)
        {
            Core::Log::Error("MainPassNode: bind group {} set before any pipeline was bound.", command.Index);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        auto descriptor = pipelines.Get(*pipeline);
        if (!descriptor)
        {
            Core::Log::Error("MainPassNode: bound pipeline {} is no longer loaded.", *pipeline);
            return Core::Err(Core::ErrorCode::AssetNotLoaded);
        }

        const PipelineLayout* layout = (*descriptor)->GetLayout();
        if (!layout)
        {
            Core::Log::Error("MainPassNode: bound pipeline {} has no layout.", *pipeline);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        const BindGroupDescriptor* bindGroupDescriptor = layout->GetBindGroup(command.Index);
        if (!bindGroupDescriptor)
        {
            Core::Log::Error("MainPassNode: pipeline {} declares no bind group {}.", *pipeline, command.Index);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        if (auto bound = drawState.SetBindGroup(command.Index, command.BindGroup); !bound)
            return bound;

        std::optional<std::span<const uint32_t>> dynamicOffsets;
        if (command.DynamicUniformIndices)
            dynamicOffsets = std::span<const uint32_t>(*command.DynamicUniformIndices);

        pass.SetBindGroup(command.Index, bindGroupDescriptor->Id, command.BindGroup, dynamicOffsets);
        return Core::Ok();
    }
}
