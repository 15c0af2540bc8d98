#pragma once
#include <cadence/schema/primitives.hpp>

// Schema type: submit transaction.
// Transfer proposal: creates a pending transaction and confirms it for the
// submitting owner.
namespace cadence::schema {

template <uint16_t Version>
struct submit_transaction;

template <>
struct submit_transaction<1> final {
  uint16_t version{1};
  account_id_t destination{};
  amount_t value{};
  bytes_t payload;
};

using submit_transaction_t = submit_transaction<1>;

}  // namespace cadence::schema
