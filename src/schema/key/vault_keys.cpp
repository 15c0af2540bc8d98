#include <cadence/schema/key/builder.hpp>
#include <cadence/schema/key/vault_keys.hpp>

namespace cadence::schema::key {

bytes_t make_owner_set_key() {
  return make_prefix(kOwnerSetKey);
}

bytes_t make_vault_meta_key() {
  return make_prefix(kVaultMetaKey);
}

bytes_t make_transaction_key(const uint64_t transaction_id) {
  auto b = builder{};
  b.write(kTransactionPrefix);
  b.write(transaction_id);
  return b.data;
}

bytes_t make_confirmation_key(const uint64_t transaction_id,
                              const account_id_t& owner) {
  auto b = builder{};
  b.write(kConfirmationPrefix);
  b.write(transaction_id);
  b.write("|");
  b.write(owner);
  return b.data;
}

bytes_t make_subscription_key(const uint64_t subscription_id) {
  auto b = builder{};
  b.write(kSubscriptionPrefix);
  b.write(subscription_id);
  return b.data;
}

bytes_t make_event_key(const uint64_t event_id) {
  auto b = builder{};
  b.write(kEventPrefix);
  b.write(event_id);
  return b.data;
}

bytes_t make_prefix(const std::string_view prefix) {
  auto b = builder{};
  b.write(prefix);
  return b.data;
}

}  // namespace cadence::schema::key
