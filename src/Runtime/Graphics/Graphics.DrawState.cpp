module;
#include <algorithm>
#include <cstdint>
#include <optional>

module Graphics:DrawState.Impl;
import :DrawState;
import :Pipeline;
import Core;
import RHI;

namespace Graphics
{
    Core::Result DrawState::SetPipeline(RHI::PipelineHandle handle, const PipelineDescriptor& descriptor)
    {
        const PipelineLayout* layout = descriptor.GetLayout();
        if (!layout)
        {
            Core::Log::Error("DrawState: pipeline {} ('{}') has no layout.", handle, descriptor.Name);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        m_BindGroups.clear();
        m_VertexBuffers.clear();
        m_IndexBuffer.reset();

        m_Pipeline = handle;
        m_BindGroups.resize(layout->GetBindGroupCount());
        m_VertexBuffers.resize(layout->GetVertexBufferCount());
        return Core::Ok();
    }

    Core::Result DrawState::SetBindGroup(uint32_t index, RHI::BindGroupId bindGroup)
    {
        if (index >= m_BindGroups.size())
        {
            Core::Log::Error("DrawState: bind group index {} out of range for pipeline {} ({} bind groups).",
                             index, m_Pipeline.value_or(RHI::PipelineHandle{}), m_BindGroups.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        m_BindGroups[index] = bindGroup;
        return Core::Ok();
    }

    Core::Result DrawState::SetVertexBuffer(uint32_t slot, RHI::BufferId buffer)
    {
        if (slot >= m_VertexBuffers.size())
        {
            Core::Log::Error("DrawState: vertex buffer slot {} out of range for pipeline {} ({} slots).",
                             slot, m_Pipeline.value_or(RHI::PipelineHandle{}), m_VertexBuffers.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        m_VertexBuffers[slot] = buffer;
        return Core::Ok();
    }

    bool DrawState::CanDrawIndexed() const
    {
        auto isSet = [](const auto& binding) { return binding.has_value(); };

        return std::ranges::all_of(m_BindGroups, isSet)
            && std::ranges::all_of(m_VertexBuffers, isSet)
            && m_IndexBuffer.has_value();
    }
}
