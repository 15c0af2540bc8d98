#pragma once

#include <cadence/execution/collaborators.hpp>
#include <cadence/gateway/principal.hpp>
#include <cadence/schema/primitives.hpp>

#include <functional>
#include <set>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace cadence::testing {

/// Principal whose behaviour is supplied by the test.
class scripted_principal final : public cadence::gateway::principal {
 public:
  using behaviour_t = std::function<bool(const cadence::gateway::call_request&,
                                         cadence::gateway::fee_meter&)>;

  scripted_principal() = default;
  explicit scripted_principal(behaviour_t behaviour)
      : behaviour_{std::move(behaviour)} {}

  bool on_call(const cadence::gateway::call_request& request,
               cadence::gateway::fee_meter& meter) override {
    requests.push_back(request);
    if (!behaviour_) {
      return true;
    }
    return behaviour_(request, meter);
  }

  void set_behaviour(behaviour_t behaviour) { behaviour_ = std::move(behaviour); }

  std::vector<cadence::gateway::call_request> requests;

 private:
  behaviour_t behaviour_;
};

struct new_subscription_notice final {
  cadence::schema::account_id_t destination{};
  cadence::schema::account_id_t vault_id{};
  uint64_t subscription_id{};
  cadence::schema::hash32_t external_id{};
};

struct payment_notice final {
  cadence::schema::account_id_t destination{};
  uint64_t subscription_id{};
  cadence::schema::hash32_t external_id{};
  bool is_first_cycle{};
};

class fake_registry final : public cadence::execution::registry_service {
 public:
  bool is_operator(const cadence::schema::account_id_t& account) override {
    ++operator_queries;
    return operators.contains(account);
  }

  void handle_new_subscription(const cadence::schema::account_id_t& destination,
                               const cadence::schema::account_id_t& vault_id,
                               const uint64_t subscription_id,
                               const cadence::schema::hash32_t& external_id) override {
    if (fail_notifications) {
      throw std::runtime_error{"registry unavailable"};
    }
    new_subscriptions.push_back(new_subscription_notice{
        .destination = destination,
        .vault_id = vault_id,
        .subscription_id = subscription_id,
        .external_id = external_id});
  }

  void handle_payment_notification(
      const cadence::schema::account_id_t& destination,
      const uint64_t subscription_id,
      const cadence::schema::hash32_t& external_id,
      const bool is_first_cycle) override {
    if (fail_notifications) {
      throw std::runtime_error{"tracker unavailable"};
    }
    payments.push_back(payment_notice{.destination = destination,
                                      .subscription_id = subscription_id,
                                      .external_id = external_id,
                                      .is_first_cycle = is_first_cycle});
  }

  std::set<cadence::schema::account_id_t> operators;
  bool fail_notifications{false};
  uint32_t operator_queries{};
  std::vector<new_subscription_notice> new_subscriptions;
  std::vector<payment_notice> payments;
};

class fake_token final : public cadence::execution::token_service {
 public:
  using transfer_t = std::tuple<cadence::schema::account_id_t,
                                cadence::schema::account_id_t,
                                cadence::schema::amount_t>;

  bool transfer_on_behalf(const cadence::schema::account_id_t& from,
                          const cadence::schema::account_id_t& to,
                          const cadence::schema::amount_t& value) override {
    if (on_transfer) {
      on_transfer();
    }
    if (!succeed) {
      return false;
    }
    transfers.emplace_back(from, to, value);
    return true;
  }

  bool succeed{true};
  std::function<void()> on_transfer;
  std::vector<transfer_t> transfers;
};

}  // namespace cadence::testing
