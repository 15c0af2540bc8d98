#pragma once

#include <cadence/gateway/gateway.hpp>
#include <cadence/gateway/principal.hpp>
#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace cadence::execution {

inline constexpr auto kDefaultNotificationFeeBudget = uint64_t{50'000};

struct engine_options final {
  cadence::schema::account_id_t vault_id{};
  cadence::schema::account_id_t registry_id{};
  std::optional<cadence::schema::account_id_t> payment_tracker_id;
  uint64_t call_fee_budget{cadence::gateway::kDefaultCallFeeBudget};
  uint64_t notification_fee_budget{kDefaultNotificationFeeBudget};
  // Only read when the database holds no owner set yet.
  std::vector<cadence::schema::account_id_t> initial_owners;
  uint32_t initial_required{1};
};

using engine_options_t = engine_options;

}  // namespace cadence::execution
