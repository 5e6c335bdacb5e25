#pragma once

#include <cstdint>

namespace Trove
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        InvalidArgument,

        // Allocator returned nullptr
        AllocationFailed,
        // Size arithmetic would overflow std::size_t
        CapacityOverflow,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator!=(const Error& other) const noexcept
        {
            return code != other.code;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::InvalidArgument: return "Invalid argument";
                case ErrorCode::AllocationFailed: return "Allocation failed";
                case ErrorCode::CapacityOverflow: return "Capacity overflow";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }
}
