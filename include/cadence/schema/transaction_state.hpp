#pragma once

#include <cadence/schema/primitives.hpp>
#include <cstdint>

// Schema type: transaction state.
// One-off transfer ledger row: pending until quorum is reached and the
// outbound call succeeds.
namespace cadence::schema {

template <uint16_t Version>
struct transaction_state;

template <>
struct transaction_state<1> final {
  uint16_t version{1};
  uint64_t transaction_id{};
  account_id_t destination{};
  amount_t value{};
  bytes_t payload;
  bool executed{};
  account_id_t submitted_by{};
  timestamp_milliseconds_t submitted_at{};
};

using transaction_state_t = transaction_state<1>;

}  // namespace cadence::schema
