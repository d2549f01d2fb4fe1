#pragma once

#include <string>
#include <string_view>
#include <concepts>


namespace arbwire::core::protocol::schema::intent {

/*
===============================================================================
 Intent concept
===============================================================================

An outbound command addressed to the execution collaborator. Every intent
names itself (used for logging) and serializes to the JSON envelope the
collaborator expects ({"type": ..., ...}).

Intents are fire-and-forget: replies, if any, arrive later as
"execution_update" messages.
===============================================================================
*/

template <class T>
concept Intent = requires(const T& intent) {
    { T::name } -> std::convertible_to<std::string_view>;
    { intent.to_json() } -> std::same_as<std::string>;
};

} // namespace arbwire::core::protocol::schema::intent
