#pragma once

#include <cstdint>
#include <string_view>

#include <simdjson.h>

#include "arbwire/core/protocol/enums/message_kind.hpp"


namespace arbwire::core {
namespace protocol {
namespace schema {

/*
===============================================================================
 Envelope
===============================================================================

Every inbound frame:
{ "message_type": "price_update", "data": { ... }, "timestamp": 1700000000000 }

Transient: `kind_name` and `data` point into the parser's document and are
only valid during the parse_and_route() call that produced them.
===============================================================================
*/

struct Envelope {
    MessageKind kind{MessageKind::Unknown};
    std::string_view kind_name;
    simdjson::dom::element data;
    std::int64_t timestamp_ms{0};   // envelope timestamp, or receive time when absent
};

} // namespace schema
} // namespace protocol
} // namespace arbwire::core
