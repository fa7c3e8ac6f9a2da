module;
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module RHI:Recording;

import :Types;
import :Pass;
import :Bindings;
import :RenderContext;
import Core;

export namespace RHI
{
    // One backend call as observed by RecordingRenderContext.
    // Only the fields relevant to Type are meaningful.
    struct RecordedCall
    {
        enum class Kind : uint8_t
        {
            BeginPass,
            SetPipeline,
            SetVertexBuffer,
            SetIndexBuffer,
            SetBindGroup,
            DrawIndexed,
            EndPass
        };

        Kind Type = Kind::BeginPass;

        // BeginPass
        std::vector<TextureId> ColorTargets{};
        std::optional<TextureId> DepthTarget{};
        size_t BindingCount = 0;

        // SetPipeline
        PipelineHandle Pipeline{};

        // SetVertexBuffer / SetIndexBuffer
        uint32_t Slot = 0;
        BufferId Buffer{};
        uint64_t Offset = 0;

        // SetBindGroup (Slot holds the bind group index)
        BindGroupLayoutId Layout{};
        BindGroupId Group{};
        std::optional<std::vector<uint32_t>> DynamicOffsets{};

        // DrawIndexed
        Range Indices{};
        int32_t BaseVertex = 0;
        Range Instances{};
    };

    [[nodiscard]] std::string_view CallKindToString(RecordedCall::Kind kind);

    // Human-readable single line, for logs.
    [[nodiscard]] std::string Describe(const RecordedCall& call);

    // -------------------------------------------------------------------------
    // RecordingRenderContext - headless backend
    // -------------------------------------------------------------------------
    // Implements the IRenderContext contract without a GPU and keeps every call
    // it receives, in order. Used by tests and the headless sandbox.
    class RecordingRenderContext final : public IRenderContext
    {
    public:
        RecordingRenderContext() = default;

        [[nodiscard]] Core::Result BeginPass(const PassDescriptor& descriptor,
                                             const RenderResourceBindings& bindings,
                                             const PassRecordFn& record) override;

        [[nodiscard]] std::span<const RecordedCall> GetCalls() const { return m_Calls; }
        [[nodiscard]] size_t Count(RecordedCall::Kind kind) const;
        [[nodiscard]] bool IsPassOpen() const { return m_PassOpen; }

        // Calls of one kind, in recording order.
        [[nodiscard]] std::vector<RecordedCall> Filter(RecordedCall::Kind kind) const;

        void Reset() { m_Calls.clear(); }

    private:
        class RecordingPass;

        std::vector<RecordedCall> m_Calls;
        bool m_PassOpen = false;
    };
}
