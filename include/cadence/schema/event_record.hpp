#pragma once

#include <cadence/schema/event_attribute.hpp>
#include <cadence/schema/event_type.hpp>
#include <cadence/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace cadence::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  event_type_t type{};
  timestamp_milliseconds_t recorded_at{};
  std::optional<uint64_t> transaction_id;
  std::optional<uint64_t> subscription_id;
  std::optional<account_id_t> account;
  std::vector<event_attribute_t> attributes;
};

using event_record_t = event_record<1>;

}  // namespace cadence::schema
