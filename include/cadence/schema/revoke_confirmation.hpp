#pragma once
#include <cadence/schema/primitives.hpp>

namespace cadence::schema {

template <uint16_t Version>
struct revoke_confirmation;

template <>
struct revoke_confirmation<1> final {
  uint16_t version{1};
  uint64_t transaction_id{};
};

using revoke_confirmation_t = revoke_confirmation<1>;

}  // namespace cadence::schema
