#pragma once

#include <cstdint>
#include <string_view>

namespace cadence::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  invalid_call = 1,
  unsupported_call_version = 2,
  vault_mismatch = 3,
  unexpected_value = 4,
  not_owner = 10,
  not_operator = 11,
  not_self = 12,
  transaction_missing = 20,
  subscription_missing = 21,
  owner_missing = 22,
  already_confirmed = 30,
  not_confirmed = 31,
  already_executed = 32,
  quorum_not_reached = 33,
  subscription_expired = 34,
  subscription_not_due = 35,
  subscription_paused = 36,
  subscription_in_flight = 37,
  pause_state_unchanged = 38,
  invalid_destination = 40,
  invalid_metadata = 41,
  unsupported_variant = 42,
  invalid_requirement = 43,
  invalid_owner = 44,
  owner_exists = 45,
  owner_limit_reached = 46,
  invalid_period = 47,
  external_call_failed = 50,
};

/// Coarse classification callers branch on; codes stay fine-grained for logs.
enum class error_category_t : uint8_t {
  none = 0,
  authorization = 1,
  not_found = 2,
  state_conflict = 3,
  validation = 4,
  external_call = 5
};

constexpr error_category_t category_of(const error_code_t code) {
  const auto raw = static_cast<uint32_t>(code);
  if (raw == 0) {
    return error_category_t::none;
  }
  if (raw >= 10 && raw < 20) {
    return error_category_t::authorization;
  }
  if (raw >= 20 && raw < 30) {
    return error_category_t::not_found;
  }
  if (raw >= 30 && raw < 40) {
    return error_category_t::state_conflict;
  }
  if (raw >= 50) {
    return error_category_t::external_call;
  }
  return error_category_t::validation;
}

constexpr error_category_t category_of(const uint32_t code) {
  return category_of(static_cast<error_code_t>(code));
}

constexpr std::string_view describe(const error_code_t code) {
  switch (code) {
    case error_code_t::ok:
      return "ok";
    case error_code_t::invalid_call:
      return "invalid call envelope";
    case error_code_t::unsupported_call_version:
      return "unsupported call version";
    case error_code_t::vault_mismatch:
      return "call addressed to another vault";
    case error_code_t::unexpected_value:
      return "operation does not accept attached value";
    case error_code_t::not_owner:
      return "caller is not an owner";
    case error_code_t::not_operator:
      return "caller is neither an owner nor a registered operator";
    case error_code_t::not_self:
      return "operation is only callable by the vault itself";
    case error_code_t::transaction_missing:
      return "transaction does not exist";
    case error_code_t::subscription_missing:
      return "subscription does not exist";
    case error_code_t::owner_missing:
      return "owner does not exist";
    case error_code_t::already_confirmed:
      return "transaction already confirmed by caller";
    case error_code_t::not_confirmed:
      return "transaction not confirmed by caller";
    case error_code_t::already_executed:
      return "transaction already executed";
    case error_code_t::quorum_not_reached:
      return "confirmations below required threshold";
    case error_code_t::subscription_expired:
      return "subscription expired";
    case error_code_t::subscription_not_due:
      return "subscription withdrawal window not open";
    case error_code_t::subscription_paused:
      return "subscription paused";
    case error_code_t::subscription_in_flight:
      return "subscription execution already in progress";
    case error_code_t::pause_state_unchanged:
      return "subscription already in requested pause state";
    case error_code_t::invalid_destination:
      return "destination must not be the zero account";
    case error_code_t::invalid_metadata:
      return "subscription metadata malformed";
    case error_code_t::unsupported_variant:
      return "unsupported settlement variant";
    case error_code_t::invalid_requirement:
      return "required confirmations out of range";
    case error_code_t::invalid_owner:
      return "owner must not be the zero account";
    case error_code_t::owner_exists:
      return "owner already present";
    case error_code_t::owner_limit_reached:
      return "owner count limit reached";
    case error_code_t::invalid_period:
      return "subscription period must be positive";
    case error_code_t::external_call_failed:
      return "external call failed";
  }
  return "unknown";
}

}  // namespace cadence::schema
