#include <cadence/execution/owner_set.hpp>

#include <algorithm>
#include <iterator>
#include <set>

using namespace cadence::schema;

namespace cadence::execution {

owner_set::owner_set(std::vector<account_id_t> owners, const uint32_t required)
    : owners_{std::move(owners)}, required_{required} {}

std::optional<error_code_t> owner_set::validate(
    const std::vector<account_id_t>& owners,
    const uint32_t required) {
  if (owners.size() > kMaxOwnerCount) {
    return error_code_t::owner_limit_reached;
  }
  auto seen = std::set<account_id_t>{};
  for (const auto& owner : owners) {
    if (is_zero(owner)) {
      return error_code_t::invalid_owner;
    }
    if (!seen.insert(owner).second) {
      return error_code_t::owner_exists;
    }
  }
  if (required == 0 || required > owners.size()) {
    return error_code_t::invalid_requirement;
  }
  return std::nullopt;
}

std::optional<owner_set> owner_set::make(std::vector<account_id_t> owners,
                                         const uint32_t required) {
  if (validate(owners, required).has_value()) {
    return std::nullopt;
  }
  return owner_set{std::move(owners), required};
}

std::optional<owner_set> owner_set::from_state(const owner_set_state_t& state) {
  return make(state.owners, state.required);
}

bool owner_set::contains(const account_id_t& account) const {
  return std::ranges::find(owners_, account) != std::end(owners_);
}

std::optional<error_code_t> owner_set::add(const account_id_t& owner) {
  if (is_zero(owner)) {
    return error_code_t::invalid_owner;
  }
  if (contains(owner)) {
    return error_code_t::owner_exists;
  }
  if (owners_.size() + 1 > kMaxOwnerCount) {
    return error_code_t::owner_limit_reached;
  }
  owners_.push_back(owner);
  return std::nullopt;
}

std::optional<error_code_t> owner_set::remove(const account_id_t& owner) {
  auto it = std::ranges::find(owners_, owner);
  if (it == std::end(owners_)) {
    return error_code_t::owner_missing;
  }
  // An empty set could never reach quorum again.
  if (owners_.size() == 1) {
    return error_code_t::invalid_requirement;
  }
  owners_.erase(it);
  if (required_ > owners_.size()) {
    required_ = static_cast<uint32_t>(owners_.size());
  }
  return std::nullopt;
}

std::optional<error_code_t> owner_set::replace(const account_id_t& owner,
                                               const account_id_t& new_owner) {
  auto it = std::ranges::find(owners_, owner);
  if (it == std::end(owners_)) {
    return error_code_t::owner_missing;
  }
  if (is_zero(new_owner)) {
    return error_code_t::invalid_owner;
  }
  if (contains(new_owner)) {
    return error_code_t::owner_exists;
  }
  *it = new_owner;
  return std::nullopt;
}

std::optional<error_code_t> owner_set::change_requirement(
    const uint32_t required) {
  if (required == 0 || required > owners_.size()) {
    return error_code_t::invalid_requirement;
  }
  required_ = required;
  return std::nullopt;
}

owner_set_state_t owner_set::state() const {
  return owner_set_state_t{.owners = owners_, .required = required_};
}

}  // namespace cadence::execution
