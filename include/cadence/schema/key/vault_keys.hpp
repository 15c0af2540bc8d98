#pragma once
#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Row layout of the vault tables. Every table is append-only and keyed by a
// monotonically increasing id; confirmations are the only rows ever deleted.
namespace cadence::schema::key {

inline constexpr auto kOwnerSetKey = std::string_view{"VAULT|OWNERS"};
inline constexpr auto kVaultMetaKey = std::string_view{"VAULT|META"};
inline constexpr auto kTransactionPrefix = std::string_view{"TX|"};
inline constexpr auto kConfirmationPrefix = std::string_view{"CONF|"};
inline constexpr auto kSubscriptionPrefix = std::string_view{"SUB|"};
inline constexpr auto kEventPrefix = std::string_view{"EVENT|"};

bytes_t make_owner_set_key();
bytes_t make_vault_meta_key();
bytes_t make_transaction_key(uint64_t transaction_id);
bytes_t make_confirmation_key(uint64_t transaction_id,
                              const account_id_t& owner);
bytes_t make_subscription_key(uint64_t subscription_id);
bytes_t make_event_key(uint64_t event_id);
bytes_t make_prefix(std::string_view prefix);

}  // namespace cadence::schema::key
