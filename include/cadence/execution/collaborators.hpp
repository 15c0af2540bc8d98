#pragma once

#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <memory>

namespace cadence::execution {

/// Operator registry and payment tracker. Its authorization logic lives
/// outside the vault.
class registry_service {
 public:
  virtual ~registry_service() = default;

  virtual bool is_operator(const cadence::schema::account_id_t& account) = 0;

  virtual void handle_new_subscription(
      const cadence::schema::account_id_t& destination,
      const cadence::schema::account_id_t& vault_id,
      uint64_t subscription_id,
      const cadence::schema::hash32_t& external_id) = 0;

  virtual void handle_payment_notification(
      const cadence::schema::account_id_t& destination,
      uint64_t subscription_id,
      const cadence::schema::hash32_t& external_id,
      bool is_first_cycle) = 0;
};

/// Token ledger able to move funds out of an account that approved the
/// vault.
class token_service {
 public:
  virtual ~token_service() = default;

  virtual bool transfer_on_behalf(const cadence::schema::account_id_t& from,
                                  const cadence::schema::account_id_t& to,
                                  const cadence::schema::amount_t& value) = 0;
};

/// Resolves collaborator account ids to live services.
///
/// Holds weak references only: the vault never owns its collaborators, and a
/// collaborator that has gone away resolves to nullptr.
class collaborator_directory final {
 public:
  void bind_registry(const cadence::schema::account_id_t& account,
                     const std::shared_ptr<registry_service>& service);
  void bind_token(const cadence::schema::account_id_t& account,
                  const std::shared_ptr<token_service>& service);
  void unbind(const cadence::schema::account_id_t& account);

  std::shared_ptr<registry_service> registry(
      const cadence::schema::account_id_t& account) const;
  std::shared_ptr<token_service> token(
      const cadence::schema::account_id_t& account) const;

 private:
  std::map<cadence::schema::account_id_t, std::weak_ptr<registry_service>>
      registries_;
  std::map<cadence::schema::account_id_t, std::weak_ptr<token_service>>
      tokens_;
};

}  // namespace cadence::execution
