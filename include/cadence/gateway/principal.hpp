#pragma once

#include <cadence/gateway/fee_meter.hpp>
#include <cadence/schema/primitives.hpp>

namespace cadence::gateway {

inline constexpr auto kDefaultCallFeeBudget = uint64_t{100'000};

/// Outbound call to another principal: value plus an opaque payload.
struct call_request final {
  cadence::schema::account_id_t from{};
  cadence::schema::account_id_t to{};
  cadence::schema::amount_t value{};
  cadence::schema::bytes_t payload;
  uint64_t fee_budget{kDefaultCallFeeBudget};
};

/// Code bound to an account. Implementations may call back into the vault
/// while `on_call` runs.
class principal {
 public:
  virtual ~principal() = default;

  /// Only success is reported back to the caller; anything the principal
  /// would return is dropped.
  virtual bool on_call(const call_request& request, fee_meter& meter) = 0;
};

}  // namespace cadence::gateway
