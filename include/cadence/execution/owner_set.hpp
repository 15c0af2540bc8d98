#pragma once

#include <cadence/schema/error_code.hpp>
#include <cadence/schema/owner_set_state.hpp>
#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace cadence::execution {

/// Quorum membership and required-confirmation threshold.
///
/// Invariant: 1 <= required <= owners.size() <= kMaxOwnerCount, owners are
/// distinct and never the zero account. Mutators return an error code and
/// leave the set untouched when a change would break the invariant.
class owner_set final {
 public:
  static constexpr uint32_t kMaxOwnerCount = 50;

  owner_set() = default;

  /// Check a candidate configuration without building it.
  static std::optional<cadence::schema::error_code_t> validate(
      const std::vector<cadence::schema::account_id_t>& owners,
      uint32_t required);

  static std::optional<owner_set> make(
      std::vector<cadence::schema::account_id_t> owners,
      uint32_t required);
  static std::optional<owner_set> from_state(
      const cadence::schema::owner_set_state_t& state);

  bool contains(const cadence::schema::account_id_t& account) const;
  const std::vector<cadence::schema::account_id_t>& owners() const {
    return owners_;
  }
  uint32_t required() const { return required_; }
  std::size_t size() const { return owners_.size(); }

  std::optional<cadence::schema::error_code_t> add(
      const cadence::schema::account_id_t& owner);

  /// Remove an owner; lowers `required` to the new owner count when needed.
  std::optional<cadence::schema::error_code_t> remove(
      const cadence::schema::account_id_t& owner);

  /// Swap `owner` for `new_owner` in place, keeping list order.
  std::optional<cadence::schema::error_code_t> replace(
      const cadence::schema::account_id_t& owner,
      const cadence::schema::account_id_t& new_owner);

  std::optional<cadence::schema::error_code_t> change_requirement(
      uint32_t required);

  cadence::schema::owner_set_state_t state() const;

 private:
  owner_set(std::vector<cadence::schema::account_id_t> owners,
            uint32_t required);

  std::vector<cadence::schema::account_id_t> owners_;
  uint32_t required_{};
};

}  // namespace cadence::execution
