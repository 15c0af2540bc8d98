#pragma once

#include <cadence/schema/primitives.hpp>
#include <cstdint>

// Schema type: vault meta.
// Table counters and the vault's own held balance.
namespace cadence::schema {

template <uint16_t Version>
struct vault_meta;

template <>
struct vault_meta<1> final {
  uint16_t version{1};
  amount_t balance{};
  uint64_t next_transaction_id{};
  uint64_t next_subscription_id{};
  uint64_t next_event_id{};
};

using vault_meta_t = vault_meta<1>;

}  // namespace cadence::schema
