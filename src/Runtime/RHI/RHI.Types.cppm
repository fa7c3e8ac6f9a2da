module;
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

export module RHI:Types;

import Core;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // Backend-neutral resource ids
    // -------------------------------------------------------------------------
    // Ids name GPU objects owned by the backend. Holding one never keeps the
    // object alive and never frees it.
    struct BufferTag {};
    struct TextureTag {};
    struct SamplerTag {};
    struct BindGroupTag {};
    struct BindGroupLayoutTag {};
    struct PipelineTag {};

    using BufferId = Core::StrongHandle<BufferTag>;
    using TextureId = Core::StrongHandle<TextureTag>;
    using SamplerId = Core::StrongHandle<SamplerTag>;
    using BindGroupId = Core::StrongHandle<BindGroupTag>;
    using BindGroupLayoutId = Core::StrongHandle<BindGroupLayoutTag>;

    // Handle into the pipeline asset store (Graphics::PipelineStore).
    using PipelineHandle = Core::StrongHandle<PipelineTag>;

    enum class RenderResourceType : uint8_t
    {
        Buffer,
        Texture,
        Sampler
    };

    using RenderResourceId = std::variant<BufferId, TextureId, SamplerId>;

    [[nodiscard]] constexpr RenderResourceType GetResourceType(const RenderResourceId& id)
    {
        switch (id.index())
        {
        case 0: return RenderResourceType::Buffer;
        case 1: return RenderResourceType::Texture;
        default: return RenderResourceType::Sampler;
        }
    }

    [[nodiscard]] constexpr std::optional<TextureId> GetTexture(const RenderResourceId& id)
    {
        if (const auto* texture = std::get_if<TextureId>(&id))
            return *texture;
        return std::nullopt;
    }

    [[nodiscard]] constexpr std::optional<BufferId> GetBuffer(const RenderResourceId& id)
    {
        if (const auto* buffer = std::get_if<BufferId>(&id))
            return *buffer;
        return std::nullopt;
    }

    constexpr std::string_view ResourceTypeToString(RenderResourceType type)
    {
        switch (type)
        {
        case RenderResourceType::Buffer:  return "Buffer";
        case RenderResourceType::Texture: return "Texture";
        case RenderResourceType::Sampler: return "Sampler";
        }
        return "Unknown";
    }

    // Half-open [Begin, End) range of indices or instances.
    struct Range
    {
        uint32_t Begin = 0;
        uint32_t End = 0;

        [[nodiscard]] constexpr uint32_t Count() const noexcept { return End > Begin ? End - Begin : 0; }

        auto operator<=>(const Range&) const = default;
    };
}
