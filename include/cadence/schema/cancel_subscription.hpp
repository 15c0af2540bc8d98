#pragma once
#include <cadence/schema/primitives.hpp>

namespace cadence::schema {

template <uint16_t Version>
struct cancel_subscription;

template <>
struct cancel_subscription<1> final {
  uint16_t version{1};
  uint64_t subscription_id{};
};

using cancel_subscription_t = cancel_subscription<1>;

}  // namespace cadence::schema
