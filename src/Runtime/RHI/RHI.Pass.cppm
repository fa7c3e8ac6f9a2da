module;
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

export module RHI:Pass;

import :Types;

export namespace RHI
{
    // Named input of a render graph node, resolved to a TextureId every frame.
    struct AttachmentInput
    {
        std::string Name;

        bool operator==(const AttachmentInput&) const = default;
    };

    using TextureAttachment = std::variant<AttachmentInput, TextureId>;

    [[nodiscard]] constexpr bool IsResolved(const TextureAttachment& attachment)
    {
        return std::holds_alternative<TextureId>(attachment);
    }

    // LoadOp::Clear uses ClearValue, LoadOp::Load keeps the previous contents.
    enum class LoadOp : uint8_t
    {
        Clear,
        Load
    };

    template <typename V>
    struct Operations
    {
        LoadOp Load = LoadOp::Clear;
        V ClearValue{};
        bool Store = true;
    };

    struct ColorAttachmentDescriptor
    {
        TextureAttachment Attachment;
        std::optional<TextureAttachment> ResolveTarget{};
        Operations<glm::vec4> Ops{.Load = LoadOp::Clear, .ClearValue = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f), .Store = true};
    };

    struct DepthStencilAttachmentDescriptor
    {
        TextureAttachment Attachment;
        std::optional<Operations<float>> DepthOps = Operations<float>{.Load = LoadOp::Clear, .ClearValue = 1.0f, .Store = true};
        std::optional<Operations<uint32_t>> StencilOps{};
    };

    struct PassDescriptor
    {
        std::vector<ColorAttachmentDescriptor> ColorAttachments;
        std::optional<DepthStencilAttachmentDescriptor> DepthStencilAttachment{};
        uint32_t SampleCount = 1;
    };

    // True once every Attachment (not resolve targets) names a concrete texture.
    [[nodiscard]] bool IsResolved(const PassDescriptor& descriptor);
}
