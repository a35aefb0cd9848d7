module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <type_traits>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - Typed property lookup / creation
    //                          - Untyped (boxed) writes that may mismatch
    //                          - Computations that may throw
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          not an error. Use when:
    //                          - Reverse key lookup
    //                          - Converter lookup
    //
    // 3. Raw / shared pointers - nullptr means "no such object". Use when:
    //                          - Untyped property lookup
    //                          - Converter instantiation
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //                          If violated, indicates a bug, not a runtime error.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Property errors (100-199)
        PropertyNotFound = 100,
        TypeMismatch = 101,
        UnsupportedOperation = 102,
        ComputationFailed = 103,
        ValidationFailed = 104,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,

        // Binding errors (500-599)
        ConverterNotFound = 500,

        // Threading errors (600-699)
        ThreadViolation = 600,
        Timeout = 601,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:              return "Success";
            case ErrorCode::PropertyNotFound:     return "PropertyNotFound";
            case ErrorCode::TypeMismatch:         return "TypeMismatch";
            case ErrorCode::UnsupportedOperation: return "UnsupportedOperation";
            case ErrorCode::ComputationFailed:    return "ComputationFailed";
            case ErrorCode::ValidationFailed:     return "ValidationFailed";
            case ErrorCode::InvalidArgument:      return "InvalidArgument";
            case ErrorCode::InvalidState:         return "InvalidState";
            case ErrorCode::ConverterNotFound:    return "ConverterNotFound";
            case ErrorCode::ThreadViolation:      return "ThreadViolation";
            case ErrorCode::Timeout:              return "Timeout";
            default:                              return "Unknown";
        }
    }

    // Type alias for common expected patterns
    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template<typename T>
    constexpr Expected<std::decay_t<T>> Ok(T&& value)
    {
        return Expected<std::decay_t<T>>(std::forward<T>(value));
    }

    // Helper to create error result
    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    inline constexpr Unit unit{};

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
