module;
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

export module Graphics:Pipeline;

import Core;
import RHI;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // Pipeline layout shape
    // -------------------------------------------------------------------------
    // Only the shape is described here: how many bind groups and vertex buffers
    // a pipeline expects, and which bind-group layout sits at each index.
    // Building the layout (shader reflection etc.) happens elsewhere.

    enum class BindingType : uint8_t
    {
        UniformBuffer,
        StorageBuffer,
        SampledTexture,
        Sampler
    };

    struct BindingDescriptor
    {
        std::string Name;
        uint32_t Index = 0;
        BindingType Type = BindingType::UniformBuffer;
        bool HasDynamicOffset = false;
    };

    struct BindGroupDescriptor
    {
        uint32_t Index = 0;
        RHI::BindGroupLayoutId Id{};
        std::vector<BindingDescriptor> Bindings{};
    };

    enum class VertexStepMode : uint8_t
    {
        Vertex,
        Instance
    };

    struct VertexBufferDescriptor
    {
        std::string Name;
        uint64_t Stride = 0;
        VertexStepMode StepMode = VertexStepMode::Vertex;
    };

    struct PipelineLayout
    {
        // Expected to be numbered densely: BindGroups[i].Index == i.
        std::vector<BindGroupDescriptor> BindGroups{};
        std::vector<VertexBufferDescriptor> VertexBuffers{};

        [[nodiscard]] const BindGroupDescriptor* GetBindGroup(uint32_t index) const
        {
            for (const auto& group : BindGroups)
            {
                if (group.Index == index)
                    return &group;
            }
            return nullptr;
        }

        [[nodiscard]] uint32_t GetBindGroupCount() const { return static_cast<uint32_t>(BindGroups.size()); }
        [[nodiscard]] uint32_t GetVertexBufferCount() const { return static_cast<uint32_t>(VertexBuffers.size()); }
    };

    struct PipelineDescriptor
    {
        std::string Name;

        // Empty until the layout has been built from the pipeline's shaders.
        std::optional<PipelineLayout> Layout{};

        [[nodiscard]] const PipelineLayout* GetLayout() const
        {
            return Layout ? &*Layout : nullptr;
        }
    };

    // Pipeline asset store. Resolved synchronously every time a pipeline is set.
    using PipelineStore = Core::ResourcePool<PipelineDescriptor, RHI::PipelineHandle>;
}
