#pragma once

#include <cadence/schema/primitives.hpp>
#include <cadence/schema/settlement_variant.hpp>
#include <cstdint>
#include <vector>

// Schema type: subscription state.
// Recurring withdrawal row. Eligible while withdraw_next <= now < expires;
// cancellation only moves expires, rows are never deleted.
namespace cadence::schema {

template <uint16_t Version>
struct subscription_state;

template <>
struct subscription_state<1> final {
  uint16_t version{1};
  uint64_t subscription_id{};
  account_id_t destination{};
  account_id_t recipient{};
  account_id_t token{};
  account_id_t settlement_wallet{};
  amount_t value{};
  settlement_variant_t variant{};
  timestamp_milliseconds_t created{};
  timestamp_milliseconds_t expires{kNoExpiry};
  uint64_t cycle{};
  duration_milliseconds_t period{};
  timestamp_milliseconds_t withdraw_prev{};
  timestamp_milliseconds_t withdraw_next{};
  hash32_t external_id{};
  bytes_t payload;
  std::vector<bytes_t> metadata;
  bool paused{};
};

using subscription_state_t = subscription_state<1>;

}  // namespace cadence::schema
