#include <cadence/execution/collaborators.hpp>

namespace cadence::execution {

void collaborator_directory::bind_registry(
    const cadence::schema::account_id_t& account,
    const std::shared_ptr<registry_service>& service) {
  registries_[account] = service;
}

void collaborator_directory::bind_token(
    const cadence::schema::account_id_t& account,
    const std::shared_ptr<token_service>& service) {
  tokens_[account] = service;
}

void collaborator_directory::unbind(
    const cadence::schema::account_id_t& account) {
  registries_.erase(account);
  tokens_.erase(account);
}

std::shared_ptr<registry_service> collaborator_directory::registry(
    const cadence::schema::account_id_t& account) const {
  if (auto it = registries_.find(account); it != std::end(registries_)) {
    return it->second.lock();
  }
  return nullptr;
}

std::shared_ptr<token_service> collaborator_directory::token(
    const cadence::schema::account_id_t& account) const {
  if (auto it = tokens_.find(account); it != std::end(tokens_)) {
    return it->second.lock();
  }
  return nullptr;
}

}  // namespace cadence::execution
