module;

#include <cstdint>
#include <expected>
#include <format>
#include <string_view>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - FALLIBLE operations. A returned error aborts the
    //                           caller's unit of work (e.g. one render graph node
    //                           for one frame). Never swallowed.
    //
    // 2. std::optional<T>     - QUERIES where "not found" is a valid outcome:
    //                           inactive camera names, unnamed slots, ...
    //
    // 3. Raw pointers (T*)    - ONLY for non-owning observation (components that
    //                           may not be attached, slots that may be empty).
    //
    // Recoverable per-item problems (a single malformed draw) are logged and
    // skipped by the component that detects them; they never surface here.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceBusy = 102,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,
        TypeMismatch = 304,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        PipelineCreationFailed = 403,

        // Asset errors (500-599)
        AssetNotLoaded = 500,
        AssetTypeMismatch = 502,

        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                return "Success";
            case ErrorCode::OutOfMemory:            return "OutOfMemory";
            case ErrorCode::ResourceNotFound:       return "ResourceNotFound";
            case ErrorCode::ResourceBusy:           return "ResourceBusy";
            case ErrorCode::InvalidArgument:        return "InvalidArgument";
            case ErrorCode::InvalidState:           return "InvalidState";
            case ErrorCode::InvalidFormat:          return "InvalidFormat";
            case ErrorCode::OutOfRange:             return "OutOfRange";
            case ErrorCode::TypeMismatch:           return "TypeMismatch";
            case ErrorCode::DeviceLost:             return "DeviceLost";
            case ErrorCode::PipelineCreationFailed: return "PipelineCreationFailed";
            case ErrorCode::AssetNotLoaded:         return "AssetNotLoaded";
            case ErrorCode::AssetTypeMismatch:      return "AssetTypeMismatch";
            default:                                return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}

namespace std
{
    // Lets log lines format error codes directly: Log::Error("... {}", result.error()).
    template <>
    struct formatter<Core::ErrorCode> : formatter<string_view>
    {
        auto format(Core::ErrorCode code, format_context& ctx) const
        {
            return formatter<string_view>::format(Core::ErrorCodeToString(code), ctx);
        }
    };
}
