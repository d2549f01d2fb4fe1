#pragma once

#include <cstdint>
#include <string_view>


namespace arbwire::core::protocol {

// ===============================================
// RISK LEVEL ENUM
// ===============================================
enum class RiskLevel : std::uint8_t {
    Low,
    Medium,
    High,
    Unknown
};

// Convert enum → string (wire spelling)
[[nodiscard]] inline constexpr std::string_view to_string(RiskLevel r) noexcept {
    switch (r) {
        case RiskLevel::Low:    return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High:   return "high";
        default:                return "unknown";
    }
}

// Convert string → enum. Feeds capitalize freely ("High", "HIGH", "high").
[[nodiscard]] inline constexpr RiskLevel to_risk_level_enum(std::string_view s) noexcept {
    auto eq = [](std::string_view a, std::string_view lower) {
        if (a.size() != lower.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char c = a[i];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != lower[i]) return false;
        }
        return true;
    };
    if (eq(s, "low"))    return RiskLevel::Low;
    if (eq(s, "medium")) return RiskLevel::Medium;
    if (eq(s, "high"))   return RiskLevel::High;
    return RiskLevel::Unknown;
}

} // namespace arbwire::core::protocol
