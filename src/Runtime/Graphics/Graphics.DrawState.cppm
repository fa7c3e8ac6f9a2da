module;
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

export module Graphics:DrawState;

import :Pipeline;
import Core;
import RHI;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // DrawState - what is bound right now, inside one backend pass
    // -------------------------------------------------------------------------
    // The bind-group and vertex-buffer arrays always have exactly the length
    // the bound pipeline's layout declares; both are empty before the first
    // SetPipeline. Binding a pipeline clears every binding, including the
    // index buffer.
    class DrawState
    {
    public:
        DrawState() = default;

        // InvalidState if the descriptor has no layout yet.
        [[nodiscard]] Core::Result SetPipeline(RHI::PipelineHandle handle, const PipelineDescriptor& descriptor);

        // OutOfRange if index/slot is not declared by the bound pipeline's layout.
        [[nodiscard]] Core::Result SetBindGroup(uint32_t index, RHI::BindGroupId bindGroup);
        [[nodiscard]] Core::Result SetVertexBuffer(uint32_t slot, RHI::BufferId buffer);

        void SetIndexBuffer(RHI::BufferId buffer) { m_IndexBuffer = buffer; }

        // Every bind group, every vertex buffer and the index buffer are set.
        [[nodiscard]] bool CanDrawIndexed() const;

        [[nodiscard]] std::optional<RHI::PipelineHandle> GetPipeline() const { return m_Pipeline; }
        [[nodiscard]] std::optional<RHI::BufferId> GetIndexBuffer() const { return m_IndexBuffer; }
        [[nodiscard]] std::span<const std::optional<RHI::BindGroupId>> GetBindGroups() const { return m_BindGroups; }
        [[nodiscard]] std::span<const std::optional<RHI::BufferId>> GetVertexBuffers() const { return m_VertexBuffers; }

    private:
        std::optional<RHI::PipelineHandle> m_Pipeline{};
        std::vector<std::optional<RHI::BindGroupId>> m_BindGroups{};
        std::vector<std::optional<RHI::BufferId>> m_VertexBuffers{};
        std::optional<RHI::BufferId> m_IndexBuffer{};
    };
}
