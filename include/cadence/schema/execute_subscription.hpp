#pragma once
#include <cadence/schema/primitives.hpp>

// Schema type: execute subscription.
// Withdraws one cycle once the withdrawal window is open.
namespace cadence::schema {

template <uint16_t Version>
struct execute_subscription;

template <>
struct execute_subscription<1> final {
  uint16_t version{1};
  uint64_t subscription_id{};
};

using execute_subscription_t = execute_subscription<1>;

}  // namespace cadence::schema
