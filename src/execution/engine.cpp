#include <spdlog/spdlog.h>
#include <algorithm>
#include <cadence/blake3/hash.hpp>
#include <cadence/common/critical.hpp>
#include <cadence/execution/engine.hpp>
#include <cadence/execution/metadata.hpp>
#include <cadence/schema/key/vault_keys.hpp>
#include <cadence/schema/vault_call.hpp>
#include <iterator>
#include <limits>
#include <string>
#include <tuple>

using namespace cadence::schema;

namespace {

constexpr auto kCallCodespace = std::string_view{"cadence.call"};
constexpr auto kTransactionCodespace = std::string_view{"cadence.transaction"};
constexpr auto kSubscriptionCodespace =
    std::string_view{"cadence.subscription"};
constexpr auto kDepositCodespace = std::string_view{"cadence.deposit"};

// Owner management is cheap bookkeeping but still metered like any callee.
constexpr auto kVaultCallFee = uint64_t{2'000};

hash32_t fold_state_root(const hash32_t& previous, const bytes_t& event) {
  auto material = bytes_t{};
  material.reserve(previous.size() + event.size());
  material.insert(std::end(material), std::begin(previous), std::end(previous));
  material.insert(std::end(material), std::begin(event), std::end(event));
  return cadence::blake3::hash(bytes_view_t{material.data(), material.size()});
}

void reject(call_result_t& result,
            const error_code_t code,
            const std::string_view info = {}) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{describe(code)};
  result.info = std::string{info};
  spdlog::warn("{} rejected: {} {}", result.codespace, result.log, info);
}

event_attribute_t attribute(std::string key,
                            std::string value,
                            const bool index = false) {
  return event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

// created + period * cycle, saturating at the largest timestamp.
timestamp_milliseconds_t next_withdrawal(const subscription_state_t& row) {
  constexpr auto kMax = std::numeric_limits<timestamp_milliseconds_t>::max();
  if (row.cycle != 0 && row.period > (kMax - row.created) / row.cycle) {
    return kMax;
  }
  return row.created + (row.period * row.cycle);
}

bool is_withdrawable(const subscription_state_t& row,
                     const timestamp_milliseconds_t now) {
  return now < row.expires && now >= row.withdraw_next && !row.paused;
}

template <typename Id, typename Predicate>
std::vector<Id> page(const std::vector<Id>& ids,
                     const uint64_t from,
                     const uint64_t to,
                     Predicate&& keep) {
  auto out = std::vector<Id>{};
  auto position = uint64_t{0};
  for (const auto& id : ids) {
    if (!keep(id)) {
      continue;
    }
    if (position >= from && position < to) {
      out.push_back(id);
    }
    ++position;
  }
  return out;
}

}  // namespace

namespace cadence::execution {

/// Code bound at the vault's own account. Owner management payloads are only
/// honoured while the vault is executing a transaction addressed to itself.
class engine::self_principal final : public cadence::gateway::principal {
 public:
  explicit self_principal(engine& owner) : owner_{owner} {}

  bool on_call(const cadence::gateway::call_request& request,
               cadence::gateway::fee_meter& meter) override {
    return owner_.on_self_call(request, meter);
  }

 private:
  engine& owner_;
};

/// Scope of one public invocation. Collects the events it emits and flushes
/// the dirty rows when the outermost scope closes.
struct engine::invocation final {
  explicit invocation(engine& owner)
      : owner_{owner}, previous_sink_{owner.event_sink_} {
    ++owner_.depth_;
    owner_.event_sink_ = &events;
  }

  ~invocation() {
    owner_.event_sink_ = previous_sink_;
    if (--owner_.depth_ == 0) {
      owner_.flush();
    }
  }

  invocation(const invocation&) = delete;
  invocation& operator=(const invocation&) = delete;

  engine& owner_;
  std::vector<event_record_t>* previous_sink_;
  std::vector<event_record_t> events;
};

engine::engine(
    scale_encoder_t& encoder,
    cadence::storage::storage<cadence::storage::rocksdb_storage_tag>& storage,
    cadence::gateway::external_call_gateway& gateway,
    const collaborator_directory& directory,
    engine_options_t options)
    : encoder_{encoder},
      storage_{storage},
      gateway_{gateway},
      directory_{directory},
      options_{std::move(options)},
      relay_{gateway_,
             directory_,
             options_.vault_id,
             options_.registry_id,
             options_.payment_tracker_id,
             options_.notification_fee_budget} {
  auto lock = std::scoped_lock{mutex_};
  if (is_zero(options_.vault_id)) {
    cadence::common::critical("vault id must not be the zero account");
  }
  load_persisted_state();
  gateway_.bind(options_.vault_id, std::make_shared<self_principal>(*this));
  spdlog::info(
      "Vault {} ready: {} owner(s), {} required, {} transaction(s), {} "
      "subscription(s), {} event(s)",
      to_hex(options_.vault_id), owners_.size(), owners_.required(),
      transactions_.size(), subscriptions_.size(), events_.size());
}

engine::~engine() {
  gateway_.unbind(options_.vault_id);
}

template <typename Fn>
call_result_t engine::guarded(const std::string_view codespace, Fn&& fn) {
  auto lock = std::scoped_lock{mutex_};
  auto result = call_result_t{};
  {
    auto scope = invocation{*this};
    result.codespace = std::string{codespace};
    fn(result);
    result.events = std::move(scope.events);
  }
  return result;
}

call_result_t engine::check_call(const bytes_view_t& raw_call) const {
  auto result = call_result_t{};
  result.codespace = std::string{kCallCodespace};
  if (raw_call.empty()) {
    reject(result, error_code_t::invalid_call, "empty call");
    return result;
  }
  auto decoded = encoder_.try_decode<call_t>(raw_call);
  if (!decoded) {
    reject(result, error_code_t::invalid_call, "undecodable call envelope");
    return result;
  }
  if (decoded->version != 1) {
    reject(result, error_code_t::unsupported_call_version,
           "expected version 1");
    return result;
  }
  auto payload_version = std::visit(
      [](const auto& operation) { return operation.version; },
      decoded->payload);
  if (payload_version != 1) {
    reject(result, error_code_t::unsupported_call_version,
           "expected payload version 1");
    return result;
  }
  if (decoded->vault_id != options_.vault_id) {
    reject(result, error_code_t::vault_mismatch, to_hex(decoded->vault_id));
    return result;
  }
  return result;
}

block_result_t engine::apply_block(const timestamp_milliseconds_t timestamp,
                                   const std::vector<bytes_t>& calls) {
  auto lock = std::scoped_lock{mutex_};
  auto block = block_result_t{};
  block.timestamp = timestamp;
  {
    auto scope = invocation{*this};
    for (const auto& raw : calls) {
      auto checked = check_call(make_bytes_view(raw));
      if (checked.code != 0) {
        block.call_results.push_back(std::move(checked));
        continue;
      }
      auto decoded = encoder_.decode<call_t>(make_bytes_view(raw));
      block.call_results.push_back(apply_call(timestamp, decoded));
    }
  }
  block.state_root = state_root_;
  spdlog::info("Applied {} call(s) at {}, state root {}", calls.size(),
               timestamp, to_hex(block.state_root));
  return block;
}

call_result_t engine::apply_call(const timestamp_milliseconds_t timestamp,
                                 const call_t& call) {
  if (call.vault_id != options_.vault_id) {
    auto result = call_result_t{};
    result.codespace = std::string{kCallCodespace};
    reject(result, error_code_t::vault_mismatch, to_hex(call.vault_id));
    return result;
  }
  auto context =
      call_context{.caller = call.caller, .value = call.value, .now = timestamp};
  return dispatch(context, call.payload);
}

call_result_t engine::dispatch(const call_context& context,
                               const call_payload_t& payload) {
  return std::visit(
      overloaded{
          [&](const submit_transaction_t& operation) {
            return submit_transaction(context, operation);
          },
          [&](const confirm_transaction_t& operation) {
            return confirm_transaction(context, operation);
          },
          [&](const revoke_confirmation_t& operation) {
            return revoke_confirmation(context, operation);
          },
          [&](const execute_transaction_t& operation) {
            return execute_transaction(context, operation);
          },
          [&](const submit_subscription_t& operation) {
            return submit_subscription(context, operation);
          },
          [&](const cancel_subscription_t& operation) {
            return cancel_subscription(context, operation);
          },
          [&](const pause_subscription_t& operation) {
            return set_subscription_paused(context, operation);
          },
          [&](const execute_subscription_t& operation) {
            return execute_subscription(context, operation);
          },
          [&](const deposit_t& operation) {
            return deposit(context, operation);
          }},
      payload);
}

call_result_t engine::submit_transaction(
    const call_context& context,
    const submit_transaction_t& operation) {
  return guarded(kTransactionCodespace, [&](call_result_t& result) {
    if (context.value > 0) {
      reject(result, error_code_t::unexpected_value);
      return;
    }
    if (!owners_.contains(context.caller)) {
      reject(result, error_code_t::not_owner, to_hex(context.caller));
      return;
    }
    if (is_zero(operation.destination)) {
      reject(result, error_code_t::invalid_destination);
      return;
    }

    auto id = meta_.next_transaction_id++;
    meta_dirty_ = true;
    transactions_[id] = transaction_state_t{.transaction_id = id,
                                            .destination = operation.destination,
                                            .value = operation.value,
                                            .payload = operation.payload,
                                            .executed = false,
                                            .submitted_by = context.caller,
                                            .submitted_at = context.now};
    dirty_transactions_.insert(id);
    result.record_id = id;
    emit(event_type_t::submission, context.now, id, std::nullopt,
         context.caller,
         {attribute("destination", to_hex(operation.destination), true),
          attribute("value", operation.value.str())});

    auto key = std::pair{id, context.caller};
    confirmations_[key] = confirmation_state_t{
        .transaction_id = id, .owner = context.caller, .confirmed_at = context.now};
    dirty_confirmations_.insert(key);
    emit(event_type_t::confirmation, context.now, id, std::nullopt,
         context.caller);

    if (is_confirmed(id)) {
      if (run_transaction(context.now, id, result) != error_code_t::ok) {
        result.info = "submitted, execution can be retried: " + result.info;
      }
    }
  });
}

call_result_t engine::confirm_transaction(
    const call_context& context,
    const confirm_transaction_t& operation) {
  return guarded(kTransactionCodespace, [&](call_result_t& result) {
    result.record_id = operation.transaction_id;
    if (context.value > 0) {
      reject(result, error_code_t::unexpected_value);
      return;
    }
    if (!owners_.contains(context.caller)) {
      reject(result, error_code_t::not_owner, to_hex(context.caller));
      return;
    }
    auto it = transactions_.find(operation.transaction_id);
    if (it == std::end(transactions_)) {
      reject(result, error_code_t::transaction_missing);
      return;
    }
    auto key = std::pair{operation.transaction_id, context.caller};
    if (confirmations_.contains(key)) {
      reject(result, error_code_t::already_confirmed);
      return;
    }
    if (it->second.executed) {
      reject(result, error_code_t::already_executed);
      return;
    }

    confirmations_[key] = confirmation_state_t{
        .transaction_id = operation.transaction_id,
        .owner = context.caller,
        .confirmed_at = context.now};
    dirty_confirmations_.insert(key);
    emit(event_type_t::confirmation, context.now, operation.transaction_id,
         std::nullopt, context.caller);

    if (is_confirmed(operation.transaction_id)) {
      if (run_transaction(context.now, operation.transaction_id, result) !=
          error_code_t::ok) {
        result.info = "confirmed, execution can be retried: " + result.info;
      }
    }
  });
}

call_result_t engine::revoke_confirmation(
    const call_context& context,
    const revoke_confirmation_t& operation) {
  return guarded(kTransactionCodespace, [&](call_result_t& result) {
    result.record_id = operation.transaction_id;
    if (context.value > 0) {
      reject(result, error_code_t::unexpected_value);
      return;
    }
    if (!owners_.contains(context.caller)) {
      reject(result, error_code_t::not_owner, to_hex(context.caller));
      return;
    }
    auto it = transactions_.find(operation.transaction_id);
    if (it == std::end(transactions_)) {
      reject(result, error_code_t::transaction_missing);
      return;
    }
    auto key = std::pair{operation.transaction_id, context.caller};
    if (!confirmations_.contains(key)) {
      reject(result, error_code_t::not_confirmed);
      return;
    }
    if (it->second.executed) {
      reject(result, error_code_t::already_executed);
      return;
    }

    confirmations_.erase(key);
    dirty_confirmations_.insert(key);
    emit(event_type_t::revocation, context.now, operation.transaction_id,
         std::nullopt, context.caller);
  });
}

call_result_t engine::execute_transaction(
    const call_context& context,
    const execute_transaction_t& operation) {
  return guarded(kTransactionCodespace, [&](call_result_t& result) {
    result.record_id = operation.transaction_id;
    if (context.value > 0) {
      reject(result, error_code_t::unexpected_value);
      return;
    }
    if (!owners_.contains(context.caller)) {
      reject(result, error_code_t::not_owner, to_hex(context.caller));
      return;
    }
    auto it = transactions_.find(operation.transaction_id);
    if (it == std::end(transactions_)) {
      reject(result, error_code_t::transaction_missing);
      return;
    }
    if (it->second.executed) {
      reject(result, error_code_t::already_executed);
      return;
    }
    if (!confirmations_.contains(
            std::pair{operation.transaction_id, context.caller})) {
      reject(result, error_code_t::not_confirmed);
      return;
    }
    if (!is_confirmed(operation.transaction_id)) {
      reject(result, error_code_t::quorum_not_reached);
      return;
    }
    run_transaction(context.now, operation.transaction_id, result);
  });
}

error_code_t engine::run_transaction(const timestamp_milliseconds_t now,
                                     const uint64_t transaction_id,
                                     call_result_t& result) {
  // std::map references survive inserts made by reentrant calls.
  auto& row = transactions_.at(transaction_id);
  row.executed = true;
  dirty_transactions_.insert(transaction_id);

  auto failure = std::string{};
  if (meta_.balance < row.value) {
    failure = "insufficient vault balance";
  } else {
    meta_.balance -= row.value;
    meta_dirty_ = true;

    auto to_self = row.destination == options_.vault_id;
    self_call_armed_ = to_self;
    self_call_now_ = now;
    self_call_error_.reset();
    auto ok = gateway_.call(
        cadence::gateway::call_request{.from = options_.vault_id,
                                       .to = row.destination,
                                       .value = row.value,
                                       .payload = row.payload,
                                       .fee_budget = options_.call_fee_budget});
    self_call_armed_ = false;
    if (ok) {
      emit(event_type_t::execution, now, transaction_id, std::nullopt,
           std::nullopt, {attribute("value", row.value.str())});
      spdlog::debug("Transaction {} executed", transaction_id);
      return error_code_t::ok;
    }
    meta_.balance += row.value;
    failure = self_call_error_ ? std::string{describe(*self_call_error_)}
                               : std::string{"outbound call failed"};
  }

  row.executed = false;
  emit(event_type_t::execution_failure, now, transaction_id, std::nullopt,
       std::nullopt, {attribute("reason", failure)});
  reject(result, error_code_t::external_call_failed, failure);
  return error_code_t::external_call_failed;
}

bool engine::on_self_call(const cadence::gateway::call_request& request,
                          cadence::gateway::fee_meter& meter) {
  auto lock = std::scoped_lock{mutex_};
  if (request.from != options_.vault_id || !self_call_armed_) {
    spdlog::warn("Rejected vault call from {}", to_hex(request.from));
    self_call_error_ = error_code_t::not_self;
    return false;
  }
  self_call_armed_ = false;

  auto now = self_call_now_;

  if (request.payload.empty()) {
    meta_.balance += request.value;
    meta_dirty_ = true;
    return true;
  }
  if (!meter.charge(kVaultCallFee)) {
    return false;
  }
  auto decoded = encoder_.try_decode<vault_call_t>(make_bytes_view(request.payload));
  if (!decoded) {
    self_call_error_ = error_code_t::invalid_call;
    return false;
  }

  auto candidate = owners_;
  auto events = std::vector<std::tuple<event_type_t, std::optional<account_id_t>,
                                       std::vector<event_attribute_t>>>{};
  auto error = std::visit(
      overloaded{
          [&](const add_owner_t& operation) {
            auto failed = candidate.add(operation.owner);
            events.emplace_back(event_type_t::owner_addition, operation.owner,
                                std::vector<event_attribute_t>{});
            return failed;
          },
          [&](const remove_owner_t& operation) {
            auto previous_required = candidate.required();
            auto failed = candidate.remove(operation.owner);
            events.emplace_back(event_type_t::owner_removal, operation.owner,
                                std::vector<event_attribute_t>{});
            if (candidate.required() != previous_required) {
              events.emplace_back(
                  event_type_t::requirement_change, std::nullopt,
                  std::vector{attribute("required",
                                        std::to_string(candidate.required()))});
            }
            return failed;
          },
          [&](const replace_owner_t& operation) {
            auto failed = candidate.replace(operation.owner, operation.new_owner);
            events.emplace_back(event_type_t::owner_removal, operation.owner,
                                std::vector<event_attribute_t>{});
            events.emplace_back(event_type_t::owner_addition,
                                operation.new_owner,
                                std::vector<event_attribute_t>{});
            return failed;
          },
          [&](const change_requirement_t& operation) {
            auto failed = candidate.change_requirement(operation.required);
            events.emplace_back(
                event_type_t::requirement_change, std::nullopt,
                std::vector{attribute("required",
                                      std::to_string(operation.required))});
            return failed;
          }},
      *decoded);
  if (error) {
    spdlog::warn("Vault call rejected: {}", describe(*error));
    self_call_error_ = *error;
    return false;
  }

  owners_ = std::move(candidate);
  owners_dirty_ = true;
  meta_.balance += request.value;
  meta_dirty_ = true;
  for (auto& [type, account, attributes] : events) {
    emit(type, now, std::nullopt, std::nullopt, account, std::move(attributes));
  }
  return true;
}

call_result_t engine::submit_subscription(
    const call_context& context,
    const submit_subscription_t& operation) {
  return guarded(kSubscriptionCodespace, [&](call_result_t& result) {
    if (!owners_.contains(context.caller)) {
      reject(result, error_code_t::not_owner, to_hex(context.caller));
      return;
    }
    if (is_zero(operation.destination)) {
      reject(result, error_code_t::invalid_destination);
      return;
    }
    if (operation.period == 0) {
      reject(result, error_code_t::invalid_period);
      return;
    }
    auto error = error_code_t::ok;
    auto terms = decode_subscription_metadata(
        operation.variant, operation.metadata, context.now, error);
    if (!terms) {
      reject(result, error, std::string{to_string(operation.variant)});
      return;
    }

    credit(context);

    auto id = meta_.next_subscription_id++;
    meta_dirty_ = true;
    auto row = subscription_state_t{};
    row.subscription_id = id;
    row.destination = operation.destination;
    row.recipient = operation.recipient;
    row.token = terms->token;
    row.settlement_wallet =
        operation.variant == settlement_variant_t::delegated_allowance
            ? terms->settlement_wallet
            : options_.vault_id;
    row.value = operation.value;
    row.variant = operation.variant;
    row.created = context.now;
    row.expires = terms->expires;
    row.cycle = 0;
    row.period = operation.period;
    row.withdraw_prev = 0;
    row.withdraw_next = context.now;
    row.external_id = terms->external_id;
    row.payload = operation.payload;
    row.metadata = operation.metadata;
    row.paused = false;
    subscriptions_[id] = row;
    dirty_subscriptions_.insert(id);
    result.record_id = id;
    emit(event_type_t::subscription_addition, context.now, std::nullopt, id,
         context.caller,
         {attribute("destination", to_hex(row.destination), true),
          attribute("variant", std::string{to_string(row.variant)}),
          attribute("value", row.value.str()),
          attribute("period", std::to_string(row.period))});
    relay_.subscription_created(row);

    auto covered_by_value = context.value >= operation.value;
    auto covered_by_balance = meta_.balance >= operation.value;
    auto funded_externally = !operation.payload.empty();
    if (!covered_by_value && !covered_by_balance && !funded_externally) {
      spdlog::debug("Subscription {} registered without first cycle", id);
      return;
    }
    if (!covered_by_value && !covered_by_balance) {
      spdlog::info("Subscription {} first cycle triggered by payload", id);
    }
    if (run_subscription(context.now, id, result) != error_code_t::ok) {
      result.info = "registered, first cycle not settled: " + result.info;
    }
  });
}

call_result_t engine::cancel_subscription(
    const call_context& context,
    const cancel_subscription_t& operation) {
  return guarded(kSubscriptionCodespace, [&](call_result_t& result) {
    result.record_id = operation.subscription_id;
    if (context.value > 0) {
      reject(result, error_code_t::unexpected_value);
      return;
    }
    if (!owners_.contains(context.caller)) {
      reject(result, error_code_t::not_owner, to_hex(context.caller));
      return;
    }
    auto it = subscriptions_.find(operation.subscription_id);
    if (it == std::end(subscriptions_)) {
      reject(result, error_code_t::subscription_missing);
      return;
    }
    if (context.now >= it->second.expires) {
      reject(result, error_code_t::subscription_expired);
      return;
    }
    it->second.expires = context.now;
    dirty_subscriptions_.insert(operation.subscription_id);
    emit(event_type_t::subscription_cancellation, context.now, std::nullopt,
         operation.subscription_id, context.caller);
  });
}

call_result_t engine::set_subscription_paused(
    const call_context& context,
    const pause_subscription_t& operation) {
  return guarded(kSubscriptionCodespace, [&](call_result_t& result) {
    result.record_id = operation.subscription_id;
    if (context.value > 0) {
      reject(result, error_code_t::unexpected_value);
      return;
    }
    if (!owners_.contains(context.caller)) {
      reject(result, error_code_t::not_owner, to_hex(context.caller));
      return;
    }
    auto it = subscriptions_.find(operation.subscription_id);
    if (it == std::end(subscriptions_)) {
      reject(result, error_code_t::subscription_missing);
      return;
    }
    if (context.now >= it->second.expires) {
      reject(result, error_code_t::subscription_expired);
      return;
    }
    if (it->second.paused == operation.paused) {
      reject(result, error_code_t::pause_state_unchanged);
      return;
    }
    it->second.paused = operation.paused;
    dirty_subscriptions_.insert(operation.subscription_id);
    emit(operation.paused ? event_type_t::subscription_pause
                          : event_type_t::subscription_resume,
         context.now, std::nullopt, operation.subscription_id, context.caller);
  });
}

call_result_t engine::execute_subscription(
    const call_context& context,
    const execute_subscription_t& operation) {
  return guarded(kSubscriptionCodespace, [&](call_result_t& result) {
    result.record_id = operation.subscription_id;
    if (context.value > 0) {
      reject(result, error_code_t::unexpected_value);
      return;
    }
    if (!owners_.contains(context.caller) && !is_operator(context.caller)) {
      reject(result, error_code_t::not_operator, to_hex(context.caller));
      return;
    }
    run_subscription(context.now, operation.subscription_id, result);
  });
}

error_code_t engine::run_subscription(const timestamp_milliseconds_t now,
                                      const uint64_t subscription_id,
                                      call_result_t& result) {
  auto it = subscriptions_.find(subscription_id);
  if (it == std::end(subscriptions_)) {
    reject(result, error_code_t::subscription_missing);
    return error_code_t::subscription_missing;
  }
  // Expiry first: cancellation is only ever visible through it.
  auto check = [&]() -> std::optional<error_code_t> {
    const auto& row = it->second;
    if (now >= row.expires) {
      return error_code_t::subscription_expired;
    }
    if (row.paused) {
      return error_code_t::subscription_paused;
    }
    if (in_flight_.contains(subscription_id)) {
      return error_code_t::subscription_in_flight;
    }
    if (now < row.withdraw_next) {
      return error_code_t::subscription_not_due;
    }
    return std::nullopt;
  }();
  if (check) {
    reject(result, *check);
    return *check;
  }

  in_flight_.insert(subscription_id);
  auto snapshot = it->second;
  auto ok = settle(snapshot);
  in_flight_.erase(subscription_id);

  auto& row = subscriptions_.at(subscription_id);
  if (!ok) {
    emit(event_type_t::subscription_execution_failure, now, std::nullopt,
         subscription_id, std::nullopt,
         {attribute("cycle", std::to_string(row.cycle))});
    reject(result, error_code_t::external_call_failed,
           std::string{to_string(row.variant)});
    return error_code_t::external_call_failed;
  }

  auto is_first_cycle = row.cycle == 0;
  row.withdraw_prev = now;
  ++row.cycle;
  row.withdraw_next = next_withdrawal(row);
  dirty_subscriptions_.insert(subscription_id);
  emit(event_type_t::subscription_execution, now, std::nullopt,
       subscription_id, std::nullopt,
       {attribute("cycle", std::to_string(row.cycle)),
        attribute("value", row.value.str()),
        attribute("withdraw_next", std::to_string(row.withdraw_next))});
  spdlog::debug("Subscription {} settled cycle {}", subscription_id, row.cycle);
  relay_.payment_executed(row, is_first_cycle);
  return error_code_t::ok;
}

bool engine::settle(const subscription_state_t& subscription) {
  switch (subscription.variant) {
    case settlement_variant_t::direct_escrow: {
      if (meta_.balance < subscription.value) {
        spdlog::warn("Subscription {} needs {} but vault holds {}",
                     subscription.subscription_id, subscription.value.str(),
                     meta_.balance.str());
        return false;
      }
      meta_.balance -= subscription.value;
      meta_dirty_ = true;
      auto ok = gateway_.call(cadence::gateway::call_request{
          .from = options_.vault_id,
          .to = subscription.destination,
          .value = subscription.value,
          .payload = subscription.payload,
          .fee_budget = options_.call_fee_budget});
      if (!ok) {
        meta_.balance += subscription.value;
      }
      return ok;
    }
    case settlement_variant_t::escrow_token:
    case settlement_variant_t::delegated_allowance: {
      auto token = directory_.token(subscription.token);
      if (!token) {
        spdlog::warn("Token {} unavailable for subscription {}",
                     to_hex(subscription.token), subscription.subscription_id);
        return false;
      }
      const auto& source =
          subscription.variant == settlement_variant_t::escrow_token
              ? options_.vault_id
              : subscription.settlement_wallet;
      return gateway_.invoke(
          subscription.token, options_.call_fee_budget,
          [&](cadence::gateway::fee_meter&) {
            return token->transfer_on_behalf(source, subscription.destination,
                                             subscription.value);
          });
    }
  }
  spdlog::error("Subscription {} has unknown settlement variant {}",
                subscription.subscription_id,
                static_cast<uint32_t>(subscription.variant));
  return false;
}

bool engine::is_operator(const account_id_t& account) {
  auto registry = directory_.registry(options_.registry_id);
  if (!registry) {
    return false;
  }
  auto answer = false;
  auto ok = gateway_.invoke(options_.registry_id, options_.call_fee_budget,
                            [&](cadence::gateway::fee_meter&) {
                              answer = registry->is_operator(account);
                              return true;
                            });
  return ok && answer;
}

call_result_t engine::deposit(const call_context& context, const deposit_t&) {
  return guarded(kDepositCodespace,
                 [&](call_result_t&) { credit(context); });
}

void engine::credit(const call_context& context) {
  if (context.value == 0) {
    return;
  }
  meta_.balance += context.value;
  meta_dirty_ = true;
  emit(event_type_t::deposit, context.now, std::nullopt, std::nullopt,
       context.caller, {attribute("value", context.value.str())});
}

void engine::emit(const event_type_t type,
                  const timestamp_milliseconds_t now,
                  std::optional<uint64_t> transaction_id,
                  std::optional<uint64_t> subscription_id,
                  std::optional<account_id_t> account,
                  std::vector<event_attribute_t> attributes) {
  auto event = event_record_t{};
  event.event_id = meta_.next_event_id++;
  event.type = type;
  event.recorded_at = now;
  event.transaction_id = transaction_id;
  event.subscription_id = subscription_id;
  event.account = std::move(account);
  event.attributes = std::move(attributes);
  meta_dirty_ = true;

  state_root_ = fold_state_root(state_root_, encoder_.encode(event));
  if (event_sink_ != nullptr) {
    event_sink_->push_back(event);
  }
  spdlog::debug("Event {} {}", event.event_id, to_string(type));
  events_.push_back(std::move(event));
}

bool engine::is_confirmed(const uint64_t transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto count = uint32_t{0};
  for (const auto& owner : owners_.owners()) {
    if (confirmations_.contains(std::pair{transaction_id, owner})) {
      ++count;
    }
    if (count == owners_.required()) {
      return true;
    }
  }
  return false;
}

uint32_t engine::confirmation_count(const uint64_t transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  return static_cast<uint32_t>(confirmations(transaction_id).size());
}

std::vector<account_id_t> engine::confirmations(
    const uint64_t transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<account_id_t>{};
  for (const auto& owner : owners_.owners()) {
    if (confirmations_.contains(std::pair{transaction_id, owner})) {
      out.push_back(owner);
    }
  }
  return out;
}

std::vector<account_id_t> engine::owners() const {
  auto lock = std::scoped_lock{mutex_};
  return owners_.owners();
}

uint32_t engine::required() const {
  auto lock = std::scoped_lock{mutex_};
  return owners_.required();
}

std::optional<transaction_state_t> engine::transaction(
    const uint64_t transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto it = transactions_.find(transaction_id);
      it != std::end(transactions_)) {
    return it->second;
  }
  return std::nullopt;
}

uint64_t engine::transaction_count(const bool pending,
                                   const bool executed) const {
  auto lock = std::scoped_lock{mutex_};
  return static_cast<uint64_t>(std::ranges::count_if(
      transactions_, [&](const auto& entry) {
        return (pending && !entry.second.executed) ||
               (executed && entry.second.executed);
      }));
}

std::vector<uint64_t> engine::transaction_ids(const uint64_t from,
                                              const uint64_t to,
                                              const bool pending,
                                              const bool executed) const {
  auto lock = std::scoped_lock{mutex_};
  auto ids = std::vector<uint64_t>{};
  for (const auto& [id, row] : transactions_) {
    ids.push_back(id);
  }
  return page(ids, from, to, [&](const uint64_t id) {
    auto done = transactions_.at(id).executed;
    return (pending && !done) || (executed && done);
  });
}

std::optional<subscription_state_t> engine::subscription(
    const uint64_t subscription_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto it = subscriptions_.find(subscription_id);
      it != std::end(subscriptions_)) {
    return it->second;
  }
  return std::nullopt;
}

uint64_t engine::subscription_count(const timestamp_milliseconds_t now,
                                    const bool withdrawable,
                                    const bool expired) const {
  auto lock = std::scoped_lock{mutex_};
  return static_cast<uint64_t>(std::ranges::count_if(
      subscriptions_, [&](const auto& entry) {
        return (withdrawable && is_withdrawable(entry.second, now)) ||
               (expired && now >= entry.second.expires);
      }));
}

std::vector<uint64_t> engine::subscription_ids(
    const uint64_t from,
    const uint64_t to,
    const timestamp_milliseconds_t now,
    const bool withdrawable,
    const bool expired) const {
  auto lock = std::scoped_lock{mutex_};
  auto ids = std::vector<uint64_t>{};
  for (const auto& [id, row] : subscriptions_) {
    ids.push_back(id);
  }
  return page(ids, from, to, [&](const uint64_t id) {
    const auto& row = subscriptions_.at(id);
    return (withdrawable && is_withdrawable(row, now)) ||
           (expired && now >= row.expires);
  });
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<event_record_t>{};
  for (const auto& event : events_) {
    if (event.event_id >= from_id && event.event_id <= to_id) {
      out.push_back(event);
    }
  }
  return out;
}

amount_t engine::balance() const {
  auto lock = std::scoped_lock{mutex_};
  return meta_.balance;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = app_info_t{};
  out.vault_id = options_.vault_id;
  out.event_count = events_.size();
  out.transaction_count = transactions_.size();
  out.subscription_count = subscriptions_.size();
  out.state_root = state_root_;
  return out;
}

void engine::load_persisted_state() {
  auto persisted_owners = storage_.get<owner_set_state_t>(
      encoder_, make_bytes_view(key::make_owner_set_key()));
  if (persisted_owners) {
    auto restored = owner_set::from_state(*persisted_owners);
    if (!restored) {
      cadence::common::critical("persisted owner set violates its invariant");
    }
    owners_ = std::move(*restored);
  } else {
    auto invalid = owner_set::validate(options_.initial_owners,
                                       options_.initial_required);
    if (invalid) {
      spdlog::error("Initial owner configuration rejected: {}",
                    describe(*invalid));
      cadence::common::critical("invalid initial owner configuration");
    }
    owners_ = *owner_set::make(options_.initial_owners,
                               options_.initial_required);
    owners_dirty_ = true;
    meta_dirty_ = true;
    spdlog::info("Initializing vault {} with {} owner(s), {} required",
                 to_hex(options_.vault_id), owners_.size(),
                 owners_.required());
  }

  if (auto meta = storage_.get<vault_meta_t>(
          encoder_, make_bytes_view(key::make_vault_meta_key()))) {
    meta_ = *meta;
  }

  for (const auto& [key, value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix(key::kTransactionPrefix)))) {
    auto row = encoder_.decode<transaction_state_t>(make_bytes_view(value));
    transactions_[row.transaction_id] = row;
  }
  for (const auto& [key, value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix(key::kConfirmationPrefix)))) {
    auto row = encoder_.decode<confirmation_state_t>(make_bytes_view(value));
    confirmations_[std::pair{row.transaction_id, row.owner}] = row;
  }
  for (const auto& [key, value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix(key::kSubscriptionPrefix)))) {
    auto row = encoder_.decode<subscription_state_t>(make_bytes_view(value));
    subscriptions_[row.subscription_id] = row;
  }
  for (const auto& [key, value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix(key::kEventPrefix)))) {
    events_.push_back(encoder_.decode<event_record_t>(make_bytes_view(value)));
  }
  persisted_event_count_ = events_.size();

  if (auto committed = storage_.load_committed_state()) {
    if (committed->event_count != events_.size()) {
      spdlog::error("Committed event count {} but {} event row(s) stored",
                    committed->event_count, events_.size());
      cadence::common::critical("event stream does not match checkpoint");
    }
    state_root_ = committed->state_root;
  } else {
    state_root_ = make_zero_hash();
  }

  if (owners_dirty_) {
    flush();
  }
}

void engine::flush() {
  auto writes = cadence::storage::write_set{};
  if (owners_dirty_) {
    writes.puts.emplace_back(key::make_owner_set_key(),
                             encoder_.encode(owners_.state()));
  }
  if (meta_dirty_) {
    writes.puts.emplace_back(key::make_vault_meta_key(), encoder_.encode(meta_));
  }
  for (auto id : dirty_transactions_) {
    writes.puts.emplace_back(key::make_transaction_key(id),
                             encoder_.encode(transactions_.at(id)));
  }
  for (const auto& entry : dirty_confirmations_) {
    auto row_key = key::make_confirmation_key(entry.first, entry.second);
    if (auto it = confirmations_.find(entry); it != std::end(confirmations_)) {
      writes.puts.emplace_back(std::move(row_key), encoder_.encode(it->second));
    } else {
      writes.deletes.push_back(std::move(row_key));
    }
  }
  for (auto id : dirty_subscriptions_) {
    writes.puts.emplace_back(key::make_subscription_key(id),
                             encoder_.encode(subscriptions_.at(id)));
  }
  for (auto i = persisted_event_count_; i < events_.size(); ++i) {
    writes.puts.emplace_back(key::make_event_key(events_[i].event_id),
                             encoder_.encode(events_[i]));
  }

  owners_dirty_ = false;
  meta_dirty_ = false;
  dirty_transactions_.clear();
  dirty_confirmations_.clear();
  dirty_subscriptions_.clear();
  persisted_event_count_ = events_.size();
  if (writes.empty()) {
    return;
  }
  storage_.commit(writes, cadence::storage::committed_state{
                              .event_count = events_.size(),
                              .state_root = state_root_});
}

}  // namespace cadence::execution
