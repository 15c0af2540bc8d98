#pragma once
#include <cadence/schema/primitives.hpp>
#include <cadence/schema/settlement_variant.hpp>
#include <vector>

// Schema type: submit subscription.
// Recurring payment setup: registers the schedule and settlement terms
// decoded from ordered metadata fields.
namespace cadence::schema {

template <uint16_t Version>
struct submit_subscription;

template <>
struct submit_subscription<1> final {
  uint16_t version{1};
  account_id_t destination{};
  account_id_t recipient{};
  amount_t value{};
  duration_milliseconds_t period{};
  settlement_variant_t variant{};
  bytes_t payload;
  std::vector<bytes_t> metadata;
};

using submit_subscription_t = submit_subscription<1>;

}  // namespace cadence::schema
