#pragma once
#include <cadence/schema/cancel_subscription.hpp>
#include <cadence/schema/confirm_transaction.hpp>
#include <cadence/schema/deposit.hpp>
#include <cadence/schema/execute_subscription.hpp>
#include <cadence/schema/execute_transaction.hpp>
#include <cadence/schema/pause_subscription.hpp>
#include <cadence/schema/primitives.hpp>
#include <cadence/schema/revoke_confirmation.hpp>
#include <cadence/schema/submit_subscription.hpp>
#include <cadence/schema/submit_transaction.hpp>
#include <variant>

namespace cadence::schema {

using call_payload_t = std::variant<submit_transaction_t,
                                    confirm_transaction_t,
                                    revoke_confirmation_t,
                                    execute_transaction_t,
                                    submit_subscription_t,
                                    cancel_subscription_t,
                                    pause_subscription_t,
                                    execute_subscription_t,
                                    deposit_t>;

/// Envelope applied by the surrounding ledger. Caller authentication happens
/// before the envelope reaches the vault.
template <uint16_t Version>
struct call;

template <>
struct call<1> final {
  uint16_t version{1};
  account_id_t vault_id{};
  account_id_t caller{};
  amount_t value{};
  call_payload_t payload{};
};

using call_t = call<1>;

}  // namespace cadence::schema
