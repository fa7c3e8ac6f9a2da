module;
#include <algorithm>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

module RHI:Recording.Impl;
import :Recording;
import :Types;
import :Pass;
import :Bindings;
import :RenderContext;
import Core;

namespace RHI
{
    class RecordingRenderContext::RecordingPass final : public IRenderPass
    {
    public:
        explicit RecordingPass(std::vector<RecordedCall>& calls) : m_Calls(calls) {}

        void SetPipeline(PipelineHandle pipeline) override
        {
            m_Calls.push_back({.Type = RecordedCall::Kind::SetPipeline, .Pipeline = pipeline});
        }

        void SetVertexBuffer(uint32_t slot, BufferId buffer, uint64_t offset) override
        {
            m_Calls.push_back({.Type = RecordedCall::Kind::SetVertexBuffer, .Slot = slot, .Buffer = buffer, .Offset = offset});
        }

        void SetIndexBuffer(BufferId buffer, uint64_t offset) override
        {
            m_Calls.push_back({.Type = RecordedCall::Kind::SetIndexBuffer, .Buffer = buffer, .Offset = offset});
        }

        void SetBindGroup(uint32_t index, BindGroupLayoutId layout, BindGroupId group,
                          std::optional<std::span<const uint32_t>> dynamicOffsets) override
        {
            RecordedCall call{.Type = RecordedCall::Kind::SetBindGroup, .Slot = index, .Layout = layout, .Group = group};
            if (dynamicOffsets)
                call.DynamicOffsets = std::vector<uint32_t>(dynamicOffsets->begin(), dynamicOffsets->end());
            m_Calls.push_back(std::move(call));
        }

        void DrawIndexed(Range indices, int32_t baseVertex, Range instances) override
        {
            m_Calls.push_back({.Type = RecordedCall::Kind::DrawIndexed, .Indices = indices, .BaseVertex = baseVertex, .Instances = instances});
        }

    private:
        std::vector<RecordedCall>& m_Calls;
    };

    namespace
    {
        // Closes the pass on every exit path of BeginPass.
        struct PassScope
        {
            std::vector<RecordedCall>& Calls;
            bool& PassOpen;

            PassScope(std::vector<RecordedCall>& calls, bool& passOpen) : Calls(calls), PassOpen(passOpen)
            {
                PassOpen = true;
            }

            ~PassScope()
            {
                Calls.push_back({.Type = RecordedCall::Kind::EndPass});
                PassOpen = false;
            }

            PassScope(const PassScope&) = delete;
            PassScope& operator=(const PassScope&) = delete;
        };
    }

    Core::Result RecordingRenderContext::BeginPass(const PassDescriptor& descriptor,
                                                   const RenderResourceBindings& bindings,
                                                   const PassRecordFn& record)
    {
        if (m_PassOpen)
        {
            Core::Log::Error("RecordingRenderContext: BeginPass called while a pass is already open.");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        if (!IsResolved(descriptor))
        {
            Core::Log::Error("RecordingRenderContext: pass descriptor has unresolved attachments.");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        RecordedCall begin{.Type = RecordedCall::Kind::BeginPass, .BindingCount = bindings.Size()};
        begin.ColorTargets.reserve(descriptor.ColorAttachments.size());
        for (const auto& color : descriptor.ColorAttachments)
            begin.ColorTargets.push_back(std::get<TextureId>(color.Attachment));
        if (descriptor.DepthStencilAttachment)
            begin.DepthTarget = std::get<TextureId>(descriptor.DepthStencilAttachment->Attachment);
        m_Calls.push_back(std::move(begin));

        PassScope scope(m_Calls, m_PassOpen);
        RecordingPass pass(m_Calls);
        return record(pass);
    }

    size_t RecordingRenderContext::Count(RecordedCall::Kind kind) const
    {
        return static_cast<size_t>(std::ranges::count_if(m_Calls,
            [kind](const RecordedCall& call) { return call.Type == kind; }));
    }

    std::vector<RecordedCall> RecordingRenderContext::Filter(RecordedCall::Kind kind) const
    {
        std::vector<RecordedCall> out;
        for (const auto& call : m_Calls)
        {
            if (call.Type == kind)
                out.push_back(call);
        }
        return out;
    }

    std::string_view CallKindToString(RecordedCall::Kind kind)
    {
        switch (kind)
        {
        case RecordedCall::Kind::BeginPass:       return "BeginPass";
        case RecordedCall::Kind::SetPipeline:     return "SetPipeline";
        case RecordedCall::Kind::SetVertexBuffer: return "SetVertexBuffer";
        case RecordedCall::Kind::SetIndexBuffer:  return "SetIndexBuffer";
        case RecordedCall::Kind::SetBindGroup:    return "SetBindGroup";
        case RecordedCall::Kind::DrawIndexed:     return "DrawIndexed";
        case RecordedCall::Kind::EndPass:         return "EndPass";
        }
        return "Unknown";
    }

    std::string Describe(const RecordedCall& call)
    {
        const std::string_view name = CallKindToString(call.Type);
        switch (call.Type)
        {
        case RecordedCall::Kind::BeginPass:
            return std::format("{} colors={} depth={} bindings={}", name, call.ColorTargets.size(),
                               call.DepthTarget ? "yes" : "no", call.BindingCount);
        case RecordedCall::Kind::SetPipeline:
            return std::format("{} {}", name, call.Pipeline);
        case RecordedCall::Kind::SetVertexBuffer:
            return std::format("{} slot={} buffer={} offset={}", name, call.Slot, call.Buffer, call.Offset);
        case RecordedCall::Kind::SetIndexBuffer:
            return std::format("{} buffer={} offset={}", name, call.Buffer, call.Offset);
        case RecordedCall::Kind::SetBindGroup:
            return std::format("{} index={} layout={} group={} dynamicOffsets={}", name, call.Slot, call.Layout,
                               call.Group, call.DynamicOffsets ? call.DynamicOffsets->size() : 0);
        case RecordedCall::Kind::DrawIndexed:
            return std::format("{} indices=[{},{}) baseVertex={} instances=[{},{})", name, call.Indices.Begin,
                               call.Indices.End, call.BaseVertex, call.Instances.Begin, call.Instances.End);
        case RecordedCall::Kind::EndPass:
            return std::string(name);
        }
        return std::string(name);
    }
}
