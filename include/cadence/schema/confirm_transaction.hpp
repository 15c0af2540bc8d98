#pragma once
#include <cadence/schema/primitives.hpp>

// Schema type: confirm transaction.
// Quorum vote: records the caller's confirmation and attempts execution.
namespace cadence::schema {

template <uint16_t Version>
struct confirm_transaction;

template <>
struct confirm_transaction<1> final {
  uint16_t version{1};
  uint64_t transaction_id{};
};

using confirm_transaction_t = confirm_transaction<1>;

}  // namespace cadence::schema
