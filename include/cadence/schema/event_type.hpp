#pragma once

#include <cadence/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Audit stream: one entry per recorded state transition.
namespace cadence::schema {

enum class event_type_t : uint8_t {
  submission = 0,
  confirmation = 1,
  revocation = 2,
  execution = 3,
  execution_failure = 4,
  deposit = 5,
  owner_addition = 6,
  owner_removal = 7,
  requirement_change = 8,
  subscription_addition = 9,
  subscription_cancellation = 10,
  subscription_pause = 11,
  subscription_resume = 12,
  subscription_execution = 13,
  subscription_execution_failure = 14
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"submission",
                                              event_type_t::submission},
    std::pair<std::string_view, event_type_t>{"confirmation",
                                              event_type_t::confirmation},
    std::pair<std::string_view, event_type_t>{"revocation",
                                              event_type_t::revocation},
    std::pair<std::string_view, event_type_t>{"execution",
                                              event_type_t::execution},
    std::pair<std::string_view, event_type_t>{"execution_failure",
                                              event_type_t::execution_failure},
    std::pair<std::string_view, event_type_t>{"deposit", event_type_t::deposit},
    std::pair<std::string_view, event_type_t>{"owner_addition",
                                              event_type_t::owner_addition},
    std::pair<std::string_view, event_type_t>{"owner_removal",
                                              event_type_t::owner_removal},
    std::pair<std::string_view, event_type_t>{
        "requirement_change", event_type_t::requirement_change},
    std::pair<std::string_view, event_type_t>{
        "subscription_addition", event_type_t::subscription_addition},
    std::pair<std::string_view, event_type_t>{
        "subscription_cancellation", event_type_t::subscription_cancellation},
    std::pair<std::string_view, event_type_t>{
        "subscription_pause", event_type_t::subscription_pause},
    std::pair<std::string_view, event_type_t>{
        "subscription_resume", event_type_t::subscription_resume},
    std::pair<std::string_view, event_type_t>{
        "subscription_execution", event_type_t::subscription_execution},
    std::pair<std::string_view, event_type_t>{
        "subscription_execution_failure",
        event_type_t::subscription_execution_failure}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace cadence::schema
