module;
#include <cstdint>
#include <functional>
#include <optional>
#include <span>

export module RHI:RenderContext;

import :Types;
import :Pass;
import :Bindings;
import Core;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // IRenderPass - calls valid between BeginPass and the end of the pass
    // -------------------------------------------------------------------------
    class IRenderPass
    {
    public:
        virtual ~IRenderPass() = default;

        virtual void SetPipeline(PipelineHandle pipeline) = 0;
        virtual void SetVertexBuffer(uint32_t slot, BufferId buffer, uint64_t offset) = 0;
        virtual void SetIndexBuffer(BufferId buffer, uint64_t offset) = 0;

        // dynamicOffsets is forwarded as given; std::nullopt means "none supplied",
        // which backends must not confuse with an empty list.
        virtual void SetBindGroup(uint32_t index,
                                  BindGroupLayoutId layout,
                                  BindGroupId group,
                                  std::optional<std::span<const uint32_t>> dynamicOffsets) = 0;

        virtual void DrawIndexed(Range indices, int32_t baseVertex, Range instances) = 0;
    };

    // Recording callback. A returned error is propagated out of BeginPass.
    using PassRecordFn = std::function<Core::Result(IRenderPass&)>;

    // -------------------------------------------------------------------------
    // IRenderContext - per-frame backend entry point
    // -------------------------------------------------------------------------
    // Contract:
    //  - descriptor must be fully resolved (IsResolved); otherwise no pass is
    //    opened and InvalidState is returned.
    //  - The pass is closed after record returns, whatever it returned.
    //  - The IRenderPass reference is only valid inside record.
    class IRenderContext
    {
    public:
        virtual ~IRenderContext() = default;

        [[nodiscard]] virtual Core::Result BeginPass(const PassDescriptor& descriptor,
                                                     const RenderResourceBindings& bindings,
                                                     const PassRecordFn& record) = 0;
    };
}
