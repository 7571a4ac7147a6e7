module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // This module defines the standardized error handling pattern for the kernel:
    //
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it. Use when:
    //                          - Inserting an entity that fails validation
    //                          - Resolving a handle that may not belong to a store
    //                          - Creating a shape from a caller-supplied config
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          not an error (e.g. an edge without endpoints).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of values owned
    //                          by a store. nullptr means "no such value".
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //                          If violated, indicates a bug, not a runtime error.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        ResourceNotFound = 101,

        // Validation errors (300-399)
        InvalidArgument = 300,
        StructuralValidationFailed = 310,
        UniquenessValidationFailed = 311,
        GeometricValidationFailed = 312,

        // Generic
        Unknown = 999
    };

    // Convert error code to string for logging
    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                    return "Success";
            case ErrorCode::ResourceNotFound:           return "ResourceNotFound";
            case ErrorCode::InvalidArgument:            return "InvalidArgument";
            case ErrorCode::StructuralValidationFailed: return "StructuralValidationFailed";
            case ErrorCode::UniquenessValidationFailed: return "UniquenessValidationFailed";
            case ErrorCode::GeometricValidationFailed:  return "GeometricValidationFailed";
            default:                                    return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    // Helper to create success result
    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    // Helper to create error result
    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
