#pragma once

#include <cstdint>
#include <string_view>


namespace arbwire::core::protocol {

// ===============================================
// EXECUTION STATUS ENUM
// ===============================================
enum class ExecutionStatus : std::uint8_t {
    Pending,
    Executing,
    Completed,
    Failed,
    Cancelled,
    Unknown
};

// Convert enum → string
[[nodiscard]] inline constexpr std::string_view to_string(ExecutionStatus s) noexcept {
    switch (s) {
        case ExecutionStatus::Pending:   return "pending";
        case ExecutionStatus::Executing: return "executing";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed:    return "failed";
        case ExecutionStatus::Cancelled: return "cancelled";
        default:                         return "unknown";
    }
}

// Convert string → enum
[[nodiscard]] inline constexpr ExecutionStatus to_execution_status_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 6:
            if (s == "failed") return ExecutionStatus::Failed;
            break;
        case 7:
            if (s == "pending") return ExecutionStatus::Pending;
            break;
        case 9:
            if (s == "executing") return ExecutionStatus::Executing;
            if (s == "completed") return ExecutionStatus::Completed;
            if (s == "cancelled") return ExecutionStatus::Cancelled;
            break;
        case 8:
            if (s == "canceled") return ExecutionStatus::Cancelled;
            break;
    }
    return ExecutionStatus::Unknown;
}

} // namespace arbwire::core::protocol
