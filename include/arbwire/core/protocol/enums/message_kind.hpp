#pragma once

#include <cstdint>
#include <string_view>


namespace arbwire::core::protocol {

// ===============================================
// MESSAGE KIND ENUM
// ===============================================
// Value of the envelope "message_type" field
enum class MessageKind : std::uint8_t {
    PriceUpdate,
    OpportunityUpdate,
    MevAlert,
    MarketDepth,
    ExecutionUpdate,
    Unknown
};

// Convert enum → string
[[nodiscard]] inline constexpr std::string_view to_string(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::PriceUpdate:       return "price_update";
        case MessageKind::OpportunityUpdate: return "opportunity_update";
        case MessageKind::MevAlert:          return "mev_alert";
        case MessageKind::MarketDepth:       return "market_depth";
        case MessageKind::ExecutionUpdate:   return "execution_update";
        default:                             return "unknown";
    }
}

// Convert string → enum
[[nodiscard]] inline constexpr MessageKind to_message_kind_enum(std::string_view s) noexcept {
    switch (s.size()) {
        case 9:  // "mev_alert"
            if (s == "mev_alert") return MessageKind::MevAlert;
            break;
        case 12: // "price_update", "market_depth"
            if (s[0] == 'p' && s == "price_update") return MessageKind::PriceUpdate;
            if (s[0] == 'm' && s == "market_depth") return MessageKind::MarketDepth;
            break;
        case 16: // "execution_update"
            if (s == "execution_update") return MessageKind::ExecutionUpdate;
            break;
        case 18: // "opportunity_update"
            if (s == "opportunity_update") return MessageKind::OpportunityUpdate;
            break;
    }
    return MessageKind::Unknown;
}

} // namespace arbwire::core::protocol
