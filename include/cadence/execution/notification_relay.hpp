#pragma once

#include <cadence/execution/collaborators.hpp>
#include <cadence/gateway/gateway.hpp>
#include <cadence/schema/subscription_state.hpp>
#include <cstdint>
#include <optional>

namespace cadence::execution {

/// Best-effort callbacks to the registry and payment tracker.
///
/// Every callback runs through the gateway under its own fee budget and its
/// outcome is only logged: nothing here can fail the subscription mutation
/// that triggered it.
class notification_relay final {
 public:
  notification_relay(
      cadence::gateway::external_call_gateway& gateway,
      const collaborator_directory& directory,
      const cadence::schema::account_id_t& vault_id,
      const cadence::schema::account_id_t& registry_id,
      std::optional<cadence::schema::account_id_t> payment_tracker_id,
      uint64_t fee_budget);

  /// Tell the registry about a newly registered subscription.
  bool subscription_created(
      const cadence::schema::subscription_state_t& subscription);

  /// Tell the payment tracker, when configured, that a cycle settled.
  bool payment_executed(
      const cadence::schema::subscription_state_t& subscription,
      bool is_first_cycle);

 private:
  cadence::gateway::external_call_gateway& gateway_;
  const collaborator_directory& directory_;
  cadence::schema::account_id_t vault_id_;
  cadence::schema::account_id_t registry_id_;
  std::optional<cadence::schema::account_id_t> payment_tracker_id_;
  uint64_t fee_budget_;
};

}  // namespace cadence::execution
