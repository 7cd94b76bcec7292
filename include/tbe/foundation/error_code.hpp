#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the battle engine and its collaborators.

#include <cstdint>
#include <string_view>

namespace tbe::foundation {

/// Error codes grouped by subsystem in 256-value hex ranges.
///
/// The subsystem of any code can be recovered from its high byte.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Logger (0x0200 - 0x02FF)
    LoggerError = 0x0200,
    LoggerFlushFailed = 0x0201,

    // Content (0x0300 - 0x03FF)
    ContentLoadFailed = 0x0300,
    ContentInvalid = 0x0301,
    SpeciesNotFound = 0x0302,

    // Persistence (0x0400 - 0x04FF)
    EncodeFailed = 0x0400,
    DecodeFailed = 0x0401,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto category = static_cast<uint32_t>(code) & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Logger";
        case 0x0300: return "Content";
        case 0x0400: return "Persistence";
        default: return "Unknown";
    }
}

} // namespace tbe::foundation
