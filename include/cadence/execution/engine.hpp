#pragma once

#include <cadence/execution/collaborators.hpp>
#include <cadence/execution/engine_options.hpp>
#include <cadence/execution/notification_relay.hpp>
#include <cadence/execution/owner_set.hpp>
#include <cadence/gateway/gateway.hpp>
#include <cadence/schema/app_info.hpp>
#include <cadence/schema/block_result.hpp>
#include <cadence/schema/call.hpp>
#include <cadence/schema/call_result.hpp>
#include <cadence/schema/confirmation_state.hpp>
#include <cadence/schema/encoding/scale/encoder.hpp>
#include <cadence/schema/error_code.hpp>
#include <cadence/schema/event_record.hpp>
#include <cadence/schema/primitives.hpp>
#include <cadence/schema/subscription_state.hpp>
#include <cadence/schema/transaction_state.hpp>
#include <cadence/schema/vault_meta.hpp>
#include <cadence/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

namespace cadence::execution {

/// Who is calling, what value they attached, and the logical clock.
struct call_context final {
  cadence::schema::account_id_t caller{};
  cadence::schema::amount_t value{};
  cadence::schema::timestamp_milliseconds_t now{};
};

/// Multi-owner vault with a transaction ledger and a subscription ledger.
///
/// Invocations are serialized by a recursive mutex. Principals reached through
/// the gateway may call back into the public API on the same thread; those
/// nested invocations see the in-memory tables directly and rows are flushed
/// to storage only when the outermost invocation returns.
class engine final {
 public:
  /// Open the vault tables from storage, or initialize a fresh vault from
  /// `options` when storage holds no owner set.
  ///
  /// An invalid initial owner configuration is unrecoverable.
  engine(cadence::schema::scale_encoder_t& encoder,
         cadence::storage::storage<cadence::storage::rocksdb_storage_tag>&
             storage,
         cadence::gateway::external_call_gateway& gateway,
         const collaborator_directory& directory,
         engine_options_t options);
  ~engine();

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Decode and validate a raw call envelope without executing it.
  cadence::schema::call_result_t check_call(
      const cadence::schema::bytes_view_t& raw_call) const;

  /// Apply raw call envelopes in order at `timestamp`.
  ///
  /// Per-call results are returned even on failures; rows touched by the
  /// whole block are persisted together.
  cadence::schema::block_result_t apply_block(
      cadence::schema::timestamp_milliseconds_t timestamp,
      const std::vector<cadence::schema::bytes_t>& calls);

  /// Apply one decoded envelope at `timestamp`.
  cadence::schema::call_result_t apply_call(
      cadence::schema::timestamp_milliseconds_t timestamp,
      const cadence::schema::call_t& call);

  /// Propose a transfer; the caller's confirmation is recorded and execution
  /// is attempted immediately.
  cadence::schema::call_result_t submit_transaction(
      const call_context& context,
      const cadence::schema::submit_transaction_t& operation);
  /// Record the caller's confirmation and execute once quorum is reached.
  cadence::schema::call_result_t confirm_transaction(
      const call_context& context,
      const cadence::schema::confirm_transaction_t& operation);
  /// Withdraw the caller's confirmation of a pending transaction.
  cadence::schema::call_result_t revoke_confirmation(
      const call_context& context,
      const cadence::schema::revoke_confirmation_t& operation);
  /// Retryable: a failed outbound call leaves the transaction pending.
  cadence::schema::call_result_t execute_transaction(
      const call_context& context,
      const cadence::schema::execute_transaction_t& operation);

  /// Register a recurring withdrawal. Payable; may settle the first cycle
  /// immediately.
  cadence::schema::call_result_t submit_subscription(
      const call_context& context,
      const cadence::schema::submit_subscription_t& operation);
  /// Expire a subscription at the current time.
  cadence::schema::call_result_t cancel_subscription(
      const call_context& context,
      const cadence::schema::cancel_subscription_t& operation);
  /// Suspend or resume executions; the schedule is left untouched.
  cadence::schema::call_result_t set_subscription_paused(
      const call_context& context,
      const cadence::schema::pause_subscription_t& operation);
  /// Owners and registry operators may trigger a due cycle.
  cadence::schema::call_result_t execute_subscription(
      const call_context& context,
      const cadence::schema::execute_subscription_t& operation);

  /// Credit attached value to the vault balance.
  cadence::schema::call_result_t deposit(
      const call_context& context,
      const cadence::schema::deposit_t& operation);

  /// True once confirmations by current owners reach the threshold.
  bool is_confirmed(uint64_t transaction_id) const;
  uint32_t confirmation_count(uint64_t transaction_id) const;
  /// Current owners that confirmed, in owner order.
  std::vector<cadence::schema::account_id_t> confirmations(
      uint64_t transaction_id) const;

  /// Current owners in insertion order.
  std::vector<cadence::schema::account_id_t> owners() const;
  /// Confirmations needed to execute a transaction.
  uint32_t required() const;

  /// Transaction row, or nullopt for an unknown id.
  std::optional<cadence::schema::transaction_state_t> transaction(
      uint64_t transaction_id) const;
  /// Number of transactions matching either selected state.
  uint64_t transaction_count(bool pending, bool executed) const;
  /// Ids of matching transactions at positions [from, to) of the filtered
  /// list.
  std::vector<uint64_t> transaction_ids(uint64_t from,
                                        uint64_t to,
                                        bool pending,
                                        bool executed) const;

  /// Subscription row, or nullopt for an unknown id.
  std::optional<cadence::schema::subscription_state_t> subscription(
      uint64_t subscription_id) const;
  /// Number of subscriptions withdrawable or expired at `now`, per the
  /// selected filters.
  uint64_t subscription_count(cadence::schema::timestamp_milliseconds_t now,
                              bool withdrawable,
                              bool expired) const;
  /// Ids at positions [from, to) of the subscriptions matching the filters.
  std::vector<uint64_t> subscription_ids(
      uint64_t from,
      uint64_t to,
      cadence::schema::timestamp_milliseconds_t now,
      bool withdrawable,
      bool expired) const;

  /// Events with ids in the inclusive range.
  std::vector<cadence::schema::event_record_t> events(uint64_t from_id,
                                                      uint64_t to_id) const;

  /// Native value held by the vault.
  cadence::schema::amount_t balance() const;
  cadence::schema::app_info_t info() const;
  const cadence::schema::account_id_t& vault_id() const {
    return options_.vault_id;
  }

 private:
  class self_principal;
  struct invocation;

  template <typename Fn>
  cadence::schema::call_result_t guarded(std::string_view codespace, Fn&& fn);

  cadence::schema::call_result_t dispatch(
      const call_context& context,
      const cadence::schema::call_payload_t& payload);

  /// Flip executed, call out, and roll back on failure.
  cadence::schema::error_code_t run_transaction(
      cadence::schema::timestamp_milliseconds_t now,
      uint64_t transaction_id,
      cadence::schema::call_result_t& result);

  /// Eligibility checks, settlement, and schedule advance on success.
  cadence::schema::error_code_t run_subscription(
      cadence::schema::timestamp_milliseconds_t now,
      uint64_t subscription_id,
      cadence::schema::call_result_t& result);

  bool settle(const cadence::schema::subscription_state_t& subscription);
  bool is_operator(const cadence::schema::account_id_t& account);
  bool on_self_call(const cadence::gateway::call_request& request,
                    cadence::gateway::fee_meter& meter);

  void credit(const call_context& context);
  void emit(cadence::schema::event_type_t type,
            cadence::schema::timestamp_milliseconds_t now,
            std::optional<uint64_t> transaction_id,
            std::optional<uint64_t> subscription_id,
            std::optional<cadence::schema::account_id_t> account,
            std::vector<cadence::schema::event_attribute_t> attributes = {});

  void load_persisted_state();
  void flush();

  mutable std::recursive_mutex mutex_;
  cadence::schema::scale_encoder_t& encoder_;
  cadence::storage::storage<cadence::storage::rocksdb_storage_tag>& storage_;
  cadence::gateway::external_call_gateway& gateway_;
  const collaborator_directory& directory_;
  engine_options_t options_;
  notification_relay relay_;

  owner_set owners_;
  cadence::schema::vault_meta_t meta_;
  std::map<uint64_t, cadence::schema::transaction_state_t> transactions_;
  std::map<std::pair<uint64_t, cadence::schema::account_id_t>,
           cadence::schema::confirmation_state_t>
      confirmations_;
  std::map<uint64_t, cadence::schema::subscription_state_t> subscriptions_;
  std::vector<cadence::schema::event_record_t> events_;
  cadence::schema::hash32_t state_root_{};

  // Pending writes for the current top-level invocation.
  bool owners_dirty_{false};
  bool meta_dirty_{false};
  std::set<uint64_t> dirty_transactions_;
  std::set<std::pair<uint64_t, cadence::schema::account_id_t>>
      dirty_confirmations_;
  std::set<uint64_t> dirty_subscriptions_;
  std::size_t persisted_event_count_{};

  uint32_t depth_{};
  std::vector<cadence::schema::event_record_t>* event_sink_{nullptr};
  std::set<uint64_t> in_flight_;
  bool self_call_armed_{false};
  cadence::schema::timestamp_milliseconds_t self_call_now_{};
  std::optional<cadence::schema::error_code_t> self_call_error_;
};

}  // namespace cadence::execution
