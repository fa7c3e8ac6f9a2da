module;
#include <cstdint>
#include <format>
#include <functional>
#include <limits>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle template
    // -------------------------------------------------------------------------
    // The Tag type parameter keeps handles of different resource kinds apart
    // at compile time:
    //
    //   struct BufferTag {};
    //   using BufferId = Core::StrongHandle<BufferTag>;
    //
    //   struct TextureTag {};
    //   using TextureId = Core::StrongHandle<TextureTag>;
    //
    //   BufferId vb{3, 1};
    //   TextureId color{0, 1};
    //   // vb = color; // Compile error - different types!
    //
    // Handles are plain values. They never own what they refer to.
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        // Packs index (low) and generation (high) into one value, for logging and keys.
        [[nodiscard]] constexpr uint64_t Raw() const noexcept
        {
            return (static_cast<uint64_t>(Generation) << 32) | Index;
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            uint64_t val = h.Raw();

            // MurmurHash3 finalizer
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };

    // Formats as "index:generation", or "<invalid>".
    template <typename Tag>
    struct formatter<Core::StrongHandle<Tag>>
    {
        constexpr auto parse(std::format_parse_context& ctx)
        {
            return ctx.begin();
        }

        auto format(const Core::StrongHandle<Tag>& h, std::format_context& ctx) const
        {
            if (!h.IsValid())
                return std::format_to(ctx.out(), "<invalid>");
            return std::format_to(ctx.out(), "{}:{}", h.Index, h.Generation);
        }
    };
}
