#include <spdlog/spdlog.h>
#include <cadence/execution/notification_relay.hpp>

using namespace cadence::schema;

namespace cadence::execution {

notification_relay::notification_relay(
    cadence::gateway::external_call_gateway& gateway,
    const collaborator_directory& directory,
    const account_id_t& vault_id,
    const account_id_t& registry_id,
    std::optional<account_id_t> payment_tracker_id,
    const uint64_t fee_budget)
    : gateway_{gateway},
      directory_{directory},
      vault_id_{vault_id},
      registry_id_{registry_id},
      payment_tracker_id_{std::move(payment_tracker_id)},
      fee_budget_{fee_budget} {}

bool notification_relay::subscription_created(
    const subscription_state_t& subscription) {
  if (is_zero(registry_id_)) {
    spdlog::debug("No registry configured, subscription {} not announced",
                  subscription.subscription_id);
    return false;
  }
  auto registry = directory_.registry(registry_id_);
  if (!registry) {
    spdlog::warn("Registry {} unavailable, subscription {} not announced",
                 to_hex(registry_id_), subscription.subscription_id);
    return false;
  }
  auto ok = gateway_.invoke(
      registry_id_, fee_budget_, [&](cadence::gateway::fee_meter&) {
        registry->handle_new_subscription(
            subscription.destination, vault_id_, subscription.subscription_id,
            subscription.external_id);
        return true;
      });
  if (!ok) {
    spdlog::warn("New subscription {} notification failed",
                 subscription.subscription_id);
  }
  return ok;
}

bool notification_relay::payment_executed(
    const subscription_state_t& subscription,
    const bool is_first_cycle) {
  if (!payment_tracker_id_) {
    return false;
  }
  auto tracker = directory_.registry(*payment_tracker_id_);
  if (!tracker) {
    spdlog::warn("Payment tracker {} unavailable for subscription {}",
                 to_hex(*payment_tracker_id_), subscription.subscription_id);
    return false;
  }
  auto ok = gateway_.invoke(
      *payment_tracker_id_, fee_budget_, [&](cadence::gateway::fee_meter&) {
        tracker->handle_payment_notification(
            subscription.destination, subscription.subscription_id,
            subscription.external_id, is_first_cycle);
        return true;
      });
  if (!ok) {
    spdlog::warn("Payment notification for subscription {} cycle {} failed",
                 subscription.subscription_id, subscription.cycle);
  } else {
    spdlog::debug("Payment notification for subscription {} first={}",
                  subscription.subscription_id, is_first_cycle);
  }
  return ok;
}

}  // namespace cadence::execution
