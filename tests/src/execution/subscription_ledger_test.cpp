#include <cadence/execution/engine.hpp>
#include <cadence/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <tuple>

using cadence::schema::error_code_t;
using cadence::schema::event_type_t;
using cadence::schema::settlement_variant_t;
using cadence::testing::code_of;
using cadence::testing::has_event;
using cadence::testing::kOutsider;
using cadence::testing::kOwner1;
using cadence::testing::kOwner2;
using cadence::testing::kPayee;
using cadence::testing::kToken;
using cadence::testing::kVault;
using cadence::testing::make_metadata;
using fixture_t = cadence::testing::execution_fixture;

namespace {

const auto kExternalId = cadence::testing::make_hash(0x5E);
const auto kOperator = cadence::testing::make_account(0x0A);
const auto kWallet = cadence::testing::make_account(0xE0);

cadence::schema::submit_subscription_t escrow(
    const cadence::schema::amount_t& value,
    const cadence::schema::duration_milliseconds_t period,
    const cadence::schema::timestamp_milliseconds_t expires = 0) {
  return cadence::schema::submit_subscription_t{
      .destination = kPayee,
      .recipient = kPayee,
      .value = value,
      .period = period,
      .variant = settlement_variant_t::direct_escrow,
      .metadata = make_metadata(settlement_variant_t::direct_escrow,
                                kExternalId, {}, expires)};
}

cadence::schema::submit_subscription_t token_backed(
    const settlement_variant_t variant,
    const cadence::schema::amount_t& value,
    const cadence::schema::duration_milliseconds_t period) {
  return cadence::schema::submit_subscription_t{
      .destination = kPayee,
      .recipient = kPayee,
      .value = value,
      .period = period,
      .variant = variant,
      .metadata = make_metadata(
          variant, kExternalId, kToken, 0,
          variant == settlement_variant_t::delegated_allowance
              ? kWallet
              : cadence::schema::account_id_t{})};
}

cadence::schema::execute_subscription_t execute(const uint64_t id) {
  return cadence::schema::execute_subscription_t{.subscription_id = id};
}

}  // namespace

TEST(subscription_ledger, registers_without_first_cycle_when_unfunded) {
  auto fixture = fixture_t{"cadence_sub_unfunded"};
  auto& engine = fixture.engine();

  auto submitted =
      engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));
  ASSERT_EQ(submitted.code, 0u);
  ASSERT_EQ(submitted.record_id, std::optional<uint64_t>{0});
  EXPECT_TRUE(has_event(submitted, event_type_t::subscription_addition));
  EXPECT_FALSE(has_event(submitted, event_type_t::subscription_execution));

  auto row = engine.subscription(0);
  ASSERT_TRUE(row);
  EXPECT_EQ(row->cycle, 0u);
  EXPECT_EQ(row->created, 1000u);
  EXPECT_EQ(row->withdraw_next, 1000u);
  EXPECT_EQ(row->expires, cadence::schema::kNoExpiry);
  EXPECT_EQ(row->external_id, kExternalId);
  EXPECT_EQ(row->settlement_wallet, kVault);

  ASSERT_EQ(fixture.registry().new_subscriptions.size(), 1u);
  const auto& notice = fixture.registry().new_subscriptions.front();
  EXPECT_EQ(notice.destination, kPayee);
  EXPECT_EQ(notice.vault_id, kVault);
  EXPECT_EQ(notice.subscription_id, 0u);
  EXPECT_EQ(notice.external_id, kExternalId);
  EXPECT_TRUE(fixture.registry().payments.empty());
}

TEST(subscription_ledger, attached_value_settles_first_cycle) {
  auto fixture = fixture_t{"cadence_sub_attached_value"};
  auto& engine = fixture.engine();

  auto submitted = engine.submit_subscription(fixture_t::as(kOwner1, 1000, 100),
                                              escrow(100, 30));
  EXPECT_EQ(submitted.code, 0u);
  EXPECT_TRUE(has_event(submitted, event_type_t::deposit));
  EXPECT_TRUE(has_event(submitted, event_type_t::subscription_execution));

  auto row = engine.subscription(0);
  EXPECT_EQ(row->cycle, 1u);
  EXPECT_EQ(row->withdraw_prev, 1000u);
  EXPECT_EQ(row->withdraw_next, 1030u);
  EXPECT_EQ(fixture.gateway().delivered(kPayee), 100);
  EXPECT_EQ(engine.balance(), 0);

  ASSERT_EQ(fixture.registry().payments.size(), 1u);
  EXPECT_TRUE(fixture.registry().payments.front().is_first_cycle);
}

TEST(subscription_ledger, schedule_is_anchored_to_creation) {
  auto fixture = fixture_t{"cadence_sub_schedule"};
  auto& engine = fixture.engine();
  fixture.registry().operators.insert(kOperator);
  fixture.fund(1000);

  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));
  ASSERT_EQ(engine.subscription(0)->cycle, 1u);
  auto before = *engine.subscription(0);

  auto early = engine.execute_subscription(fixture_t::as(kOperator, 1010),
                                           execute(0));
  EXPECT_EQ(early.code, code_of(error_code_t::subscription_not_due));
  EXPECT_EQ(cadence::schema::category_of(early.code),
            cadence::schema::error_category_t::state_conflict);
  auto unchanged = *engine.subscription(0);
  EXPECT_EQ(unchanged.cycle, before.cycle);
  EXPECT_EQ(unchanged.withdraw_prev, before.withdraw_prev);
  EXPECT_EQ(unchanged.withdraw_next, before.withdraw_next);

  // Executed late: the next window still lines up with creation.
  auto due = engine.execute_subscription(fixture_t::as(kOperator, 1045),
                                         execute(0));
  EXPECT_EQ(due.code, 0u);
  auto row = *engine.subscription(0);
  EXPECT_EQ(row.cycle, 2u);
  EXPECT_EQ(row.withdraw_prev, 1045u);
  EXPECT_EQ(row.withdraw_next, 1060u);
  EXPECT_EQ(engine.balance(), 800);

  ASSERT_EQ(fixture.registry().payments.size(), 2u);
  EXPECT_FALSE(fixture.registry().payments.back().is_first_cycle);
}

TEST(subscription_ledger, only_owners_and_operators_execute) {
  auto fixture = fixture_t{"cadence_sub_operators"};
  auto& engine = fixture.engine();
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));

  auto outsider = engine.execute_subscription(fixture_t::as(kOutsider, 1000),
                                              execute(0));
  EXPECT_EQ(outsider.code, code_of(error_code_t::not_operator));
  EXPECT_EQ(cadence::schema::category_of(outsider.code),
            cadence::schema::error_category_t::authorization);
  EXPECT_GT(fixture.registry().operator_queries, 0u);

  fixture.fund(100);
  fixture.registry().operators.insert(kOperator);
  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOperator, 1000),
                                        execute(0))
                .code,
            0u);
  EXPECT_EQ(engine.subscription(0)->cycle, 1u);

  EXPECT_EQ(engine.submit_subscription(fixture_t::as(kOperator, 1000),
                                       escrow(100, 30))
                .code,
            code_of(error_code_t::not_owner));
}

TEST(subscription_ledger, works_without_registry_collaborators) {
  auto fixture = fixture_t{"cadence_sub_no_registry"};
  auto& engine = fixture.engine();
  fixture.directory().unbind(cadence::testing::kRegistry);
  fixture.directory().unbind(cadence::testing::kTracker);
  fixture.fund(100);

  auto submitted =
      engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));
  EXPECT_EQ(submitted.code, 0u);
  EXPECT_EQ(engine.subscription(0)->cycle, 1u);
  EXPECT_EQ(fixture.gateway().delivered(kPayee), 100);
  EXPECT_TRUE(fixture.registry().new_subscriptions.empty());
  EXPECT_TRUE(fixture.registry().payments.empty());

  fixture.registry().operators.insert(kOperator);
  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOperator, 1030),
                                        execute(0))
                .code,
            code_of(error_code_t::not_operator));
  EXPECT_EQ(fixture.registry().operator_queries, 0u);
}

TEST(subscription_ledger, unfunded_execution_records_failure) {
  auto fixture = fixture_t{"cadence_sub_unfunded_execution"};
  auto& engine = fixture.engine();
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));

  auto failed =
      engine.execute_subscription(fixture_t::as(kOwner2, 1000), execute(0));
  EXPECT_EQ(failed.code, code_of(error_code_t::external_call_failed));
  EXPECT_TRUE(has_event(failed, event_type_t::subscription_execution_failure));
  EXPECT_EQ(engine.subscription(0)->cycle, 0u);
  EXPECT_EQ(engine.subscription(0)->withdraw_next, 1000u);
}

TEST(subscription_ledger, escrow_token_transfers_from_vault) {
  auto fixture = fixture_t{"cadence_sub_escrow_token"};
  auto& engine = fixture.engine();
  engine.submit_subscription(
      fixture_t::as(kOwner1, 500),
      token_backed(settlement_variant_t::escrow_token, 25, 10));

  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOwner1, 500), execute(0))
                .code,
            0u);
  ASSERT_EQ(fixture.token().transfers.size(), 1u);
  EXPECT_EQ(fixture.token().transfers.front(),
            (cadence::testing::fake_token::transfer_t{kVault, kPayee, 25}));
  EXPECT_EQ(engine.subscription(0)->withdraw_next, 510u);
}

TEST(subscription_ledger, delegated_allowance_transfers_from_wallet) {
  auto fixture = fixture_t{"cadence_sub_delegated"};
  auto& engine = fixture.engine();
  auto request = token_backed(settlement_variant_t::delegated_allowance, 25, 10);
  request.payload = cadence::schema::make_bytes(std::string{"approve"});

  // A payload marks the first cycle as funded elsewhere.
  auto submitted =
      engine.submit_subscription(fixture_t::as(kOwner1, 500), request);
  EXPECT_EQ(submitted.code, 0u);
  EXPECT_EQ(engine.subscription(0)->settlement_wallet, kWallet);
  EXPECT_EQ(engine.subscription(0)->cycle, 1u);
  ASSERT_EQ(fixture.token().transfers.size(), 1u);
  EXPECT_EQ(fixture.token().transfers.front(),
            (cadence::testing::fake_token::transfer_t{kWallet, kPayee, 25}));
}

TEST(subscription_ledger, token_failure_keeps_schedule) {
  auto fixture = fixture_t{"cadence_sub_token_failure"};
  auto& engine = fixture.engine();
  fixture.token().succeed = false;
  engine.submit_subscription(
      fixture_t::as(kOwner1, 500),
      token_backed(settlement_variant_t::escrow_token, 25, 10));

  auto failed =
      engine.execute_subscription(fixture_t::as(kOwner1, 500), execute(0));
  EXPECT_EQ(failed.code, code_of(error_code_t::external_call_failed));
  EXPECT_TRUE(has_event(failed, event_type_t::subscription_execution_failure));
  EXPECT_EQ(engine.subscription(0)->cycle, 0u);

  fixture.directory().unbind(kToken);
  fixture.token().succeed = true;
  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOwner1, 500), execute(0))
                .code,
            code_of(error_code_t::external_call_failed));
  EXPECT_TRUE(fixture.token().transfers.empty());
}

TEST(subscription_ledger, throwing_destination_leaves_subscription_usable) {
  auto fixture = fixture_t{"cadence_sub_throwing_destination"};
  auto& engine = fixture.engine();
  auto payee = fixture.bind_principal(
      kPayee, [](const auto&, auto&) -> bool { throw 42; });
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));
  fixture.fund(100, 1000);

  auto failed =
      engine.execute_subscription(fixture_t::as(kOwner1, 1000), execute(0));
  EXPECT_EQ(failed.code, code_of(error_code_t::external_call_failed));
  EXPECT_TRUE(has_event(failed, event_type_t::subscription_execution_failure));
  EXPECT_EQ(engine.subscription(0)->cycle, 0u);
  EXPECT_EQ(engine.balance(), 100);

  payee->set_behaviour([](const auto&, auto&) { return true; });
  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOwner1, 1000), execute(0))
                .code,
            0u);
  EXPECT_EQ(engine.subscription(0)->cycle, 1u);
  EXPECT_EQ(engine.balance(), 0);
}

TEST(subscription_ledger, first_cycle_failure_keeps_registration) {
  auto fixture = fixture_t{"cadence_sub_first_cycle_failure"};
  auto& engine = fixture.engine();
  auto request = escrow(100, 30);
  request.payload = cadence::schema::make_bytes(std::string{"fund"});

  auto submitted =
      engine.submit_subscription(fixture_t::as(kOwner1, 1000), request);
  EXPECT_EQ(submitted.code, code_of(error_code_t::external_call_failed));
  EXPECT_EQ(submitted.record_id, std::optional<uint64_t>{0});
  EXPECT_EQ(submitted.info.rfind("registered", 0), 0u);
  ASSERT_TRUE(engine.subscription(0));
  EXPECT_EQ(engine.subscription(0)->cycle, 0u);
}

TEST(subscription_ledger, notification_failures_are_isolated) {
  auto fixture = fixture_t{"cadence_sub_notifications"};
  auto& engine = fixture.engine();
  fixture.registry().fail_notifications = true;

  auto submitted = engine.submit_subscription(
      fixture_t::as(kOwner1, 1000, 100), escrow(100, 30));
  EXPECT_EQ(submitted.code, 0u);
  EXPECT_EQ(engine.subscription(0)->cycle, 1u);
  EXPECT_TRUE(fixture.registry().new_subscriptions.empty());
  EXPECT_TRUE(fixture.registry().payments.empty());
  EXPECT_EQ(fixture.gateway().delivered(kPayee), 100);
}

TEST(subscription_ledger, pause_and_resume) {
  auto fixture = fixture_t{"cadence_sub_pause"};
  auto& engine = fixture.engine();
  fixture.fund(1000);
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));

  auto pause = cadence::schema::pause_subscription_t{.subscription_id = 0,
                                                     .paused = true};
  auto paused = engine.set_subscription_paused(fixture_t::as(kOwner2, 1010), pause);
  EXPECT_EQ(paused.code, 0u);
  EXPECT_TRUE(has_event(paused, event_type_t::subscription_pause));
  EXPECT_EQ(engine.set_subscription_paused(fixture_t::as(kOwner2, 1010), pause)
                .code,
            code_of(error_code_t::pause_state_unchanged));
  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOwner1, 1030), execute(0))
                .code,
            code_of(error_code_t::subscription_paused));
  EXPECT_EQ(engine.subscription_count(1030, true, false), 0u);

  pause.paused = false;
  auto resumed =
      engine.set_subscription_paused(fixture_t::as(kOwner2, 1040), pause);
  EXPECT_TRUE(has_event(resumed, event_type_t::subscription_resume));
  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOwner1, 1040), execute(0))
                .code,
            0u);
  EXPECT_EQ(engine.subscription(0)->cycle, 2u);
}

TEST(subscription_ledger, cancellation_expires_subscription) {
  auto fixture = fixture_t{"cadence_sub_cancel"};
  auto& engine = fixture.engine();
  fixture.fund(1000);
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));

  auto cancel = cadence::schema::cancel_subscription_t{.subscription_id = 0};
  auto cancelled = engine.cancel_subscription(fixture_t::as(kOwner2, 1040), cancel);
  EXPECT_EQ(cancelled.code, 0u);
  EXPECT_TRUE(has_event(cancelled, event_type_t::subscription_cancellation));
  EXPECT_EQ(engine.subscription(0)->expires, 1040u);

  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOwner1, 1040), execute(0))
                .code,
            code_of(error_code_t::subscription_expired));
  EXPECT_EQ(engine.execute_subscription(fixture_t::as(kOwner1, 5000), execute(0))
                .code,
            code_of(error_code_t::subscription_expired));
  EXPECT_EQ(engine.cancel_subscription(fixture_t::as(kOwner2, 5000), cancel).code,
            code_of(error_code_t::subscription_expired));
  EXPECT_EQ(engine.subscription_count(5000, false, true), 1u);
  EXPECT_EQ(engine.cancel_subscription(
                    fixture_t::as(kOwner2, 5000),
                    cadence::schema::cancel_subscription_t{.subscription_id = 9})
                .code,
            code_of(error_code_t::subscription_missing));
}

TEST(subscription_ledger, reentrant_execution_is_blocked) {
  auto fixture = fixture_t{"cadence_sub_reentrancy"};
  auto& engine = fixture.engine();
  fixture.fund(1000);

  auto inner = std::optional<uint32_t>{};
  fixture.bind_principal(kPayee, [&](const auto&, auto&) {
    inner = engine.execute_subscription(fixture_t::as(kOwner2, 1000), execute(0))
                .code;
    return true;
  });

  auto submitted =
      engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));
  EXPECT_EQ(submitted.code, 0u);
  EXPECT_EQ(inner, code_of(error_code_t::subscription_in_flight));
  EXPECT_EQ(engine.subscription(0)->cycle, 1u);
  EXPECT_EQ(fixture.gateway().delivered(kPayee), 100);
  EXPECT_EQ(engine.balance(), 900);
}

TEST(subscription_ledger, invalid_requests_register_nothing) {
  auto fixture = fixture_t{"cadence_sub_invalid"};
  auto& engine = fixture.engine();

  auto zero_period = escrow(100, 0);
  EXPECT_EQ(engine.submit_subscription(fixture_t::as(kOwner1, 1000), zero_period)
                .code,
            code_of(error_code_t::invalid_period));

  auto stale_expiry = escrow(100, 30, 900);
  EXPECT_EQ(engine.submit_subscription(fixture_t::as(kOwner1, 1000, 100),
                                       stale_expiry)
                .code,
            code_of(error_code_t::invalid_metadata));

  auto short_metadata = escrow(100, 30);
  short_metadata.metadata.pop_back();
  EXPECT_EQ(engine.submit_subscription(fixture_t::as(kOwner1, 1000),
                                       short_metadata)
                .code,
            code_of(error_code_t::invalid_metadata));

  auto unknown_variant = escrow(100, 30);
  unknown_variant.variant = static_cast<settlement_variant_t>(7);
  EXPECT_EQ(engine.submit_subscription(fixture_t::as(kOwner1, 1000),
                                       unknown_variant)
                .code,
            code_of(error_code_t::unsupported_variant));

  EXPECT_FALSE(engine.subscription(0));
  EXPECT_EQ(engine.balance(), 0);
  EXPECT_TRUE(fixture.registry().new_subscriptions.empty());
}

TEST(subscription_ledger, counts_and_ids_filter_by_state) {
  auto fixture = fixture_t{"cadence_sub_filters"};
  auto& engine = fixture.engine();
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30, 1500));
  engine.submit_subscription(fixture_t::as(kOwner1, 1000), escrow(100, 30));
  engine.set_subscription_paused(
      fixture_t::as(kOwner1, 1000),
      cadence::schema::pause_subscription_t{.subscription_id = 2, .paused = true});

  EXPECT_EQ(engine.subscription_count(1200, true, true), 2u);
  EXPECT_EQ(engine.subscription_ids(0, 10, 1200, true, false),
            (std::vector<uint64_t>{0, 1}));
  EXPECT_EQ(engine.subscription_ids(0, 10, 2000, true, false),
            (std::vector<uint64_t>{0}));
  EXPECT_EQ(engine.subscription_ids(0, 10, 2000, false, true),
            (std::vector<uint64_t>{1}));
  EXPECT_EQ(engine.subscription_ids(1, 2, 2000, true, true),
            (std::vector<uint64_t>{1}));
}
