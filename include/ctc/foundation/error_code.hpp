#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat timing core.

#include <cstdint>
#include <string_view>

namespace ctc::foundation {

/// Error codes grouped by subsystem.
///
/// Each subsystem owns a 256-value range (0x100), so the origin of an
/// error can be read from the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Timing (0x0100 - 0x01FF)
    TimingError = 0x0100,
    InvalidActor = 0x0101,
    ActionNotPermitted = 0x0102,
    NoActionInProgress = 0x0103,
    ProviderFailed = 0x0104,
    WeaponTableLoadFailed = 0x0105,

    // Scheduler (0x0200 - 0x02FF)
    SchedulerError = 0x0200,
    TimerServiceNotReady = 0x0201,
    TimerNotFound = 0x0202,
    ParticipantNotFound = 0x0203,
    SchedulerStopped = 0x0204,

    // Audit (0x0300 - 0x03FF)
    AuditError = 0x0300,
    AuditDisabled = 0x0301,
    AuditFlushFailed = 0x0302,
    AuditFlushInProgress = 0x0303,
    AuditExportFailed = 0x0304,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Timing";
        case 0x0200: return "Scheduler";
        case 0x0300: return "Audit";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace ctc::foundation