#pragma once
#include <cadence/schema/primitives.hpp>

// Schema type: execute transaction.
// Retries execution of a confirmed, not yet executed transaction.
namespace cadence::schema {

template <uint16_t Version>
struct execute_transaction;

template <>
struct execute_transaction<1> final {
  uint16_t version{1};
  uint64_t transaction_id{};
};

using execute_transaction_t = execute_transaction<1>;

}  // namespace cadence::schema
