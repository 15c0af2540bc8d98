#pragma once

#include <cadence/schema/primitives.hpp>
#include <cstdint>

// Schema type: confirmation state.
// Presence of the row means the owner currently confirms the transaction.
namespace cadence::schema {

template <uint16_t Version>
struct confirmation_state;

template <>
struct confirmation_state<1> final {
  uint16_t version{1};
  uint64_t transaction_id{};
  account_id_t owner{};
  timestamp_milliseconds_t confirmed_at{};
};

using confirmation_state_t = confirmation_state<1>;

}  // namespace cadence::schema
