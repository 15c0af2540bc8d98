#pragma once

#include <spdlog/spdlog.h>
#include <cadence/gateway/fee_meter.hpp>
#include <cadence/gateway/principal.hpp>
#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <utility>

namespace cadence::gateway {

inline constexpr auto kDefaultMaxCallDepth = uint32_t{16};
// Flat cost of entering another principal, charged before its code runs.
inline constexpr auto kCallBaseFee = uint64_t{700};

/// Bounded, failure-contained invocation of other principals' code.
///
/// Every entry point returns a plain success flag and never throws: exceptions
/// raised by the callee, fee exhaustion and excessive nesting all surface as
/// `false`. Callers own compensating their own state on failure.
class external_call_gateway final {
 public:
  explicit external_call_gateway(uint32_t max_depth = kDefaultMaxCallDepth);

  external_call_gateway(const external_call_gateway&) = delete;
  external_call_gateway& operator=(const external_call_gateway&) = delete;

  /// Bind principal code to an account, replacing any previous binding.
  void bind(const cadence::schema::account_id_t& account,
            std::shared_ptr<principal> code);
  void unbind(const cadence::schema::account_id_t& account);
  bool is_bound(const cadence::schema::account_id_t& account) const;

  /// Deliver value and payload to `request.to`. Accounts without bound code
  /// accept plain transfers.
  bool call(const call_request& request);

  /// Run collaborator code on behalf of `target` under a fresh fee meter.
  ///
  /// `fn` receives the meter and returns the call's success flag.
  template <typename Fn>
  bool invoke(const cadence::schema::account_id_t& target,
              uint64_t fee_budget,
              Fn&& fn);

  /// Total value successfully delivered to an account through `call`.
  cadence::schema::amount_t delivered(
      const cadence::schema::account_id_t& account) const;

  uint32_t depth() const { return depth_; }

 private:
  struct depth_guard final {
    explicit depth_guard(uint32_t& depth) : depth_{depth} { ++depth_; }
    ~depth_guard() { --depth_; }
    depth_guard(const depth_guard&) = delete;
    depth_guard& operator=(const depth_guard&) = delete;
    uint32_t& depth_;
  };

  std::map<cadence::schema::account_id_t, std::shared_ptr<principal>>
      principals_;
  std::map<cadence::schema::account_id_t, cadence::schema::amount_t>
      delivered_;
  uint32_t depth_{};
  uint32_t max_depth_{kDefaultMaxCallDepth};
};

template <typename Fn>
bool external_call_gateway::invoke(const cadence::schema::account_id_t& target,
                                   const uint64_t fee_budget,
                                   Fn&& fn) {
  if (depth_ >= max_depth_) {
    spdlog::warn("Call depth limit {} reached calling {}", max_depth_,
                 cadence::schema::to_hex(target));
    return false;
  }
  auto meter = fee_meter{fee_budget};
  if (!meter.charge(kCallBaseFee)) {
    spdlog::warn("Fee budget {} below base call fee calling {}", fee_budget,
                 cadence::schema::to_hex(target));
    return false;
  }

  auto guard = depth_guard{depth_};
  auto ok = false;
  try {
    ok = std::invoke(std::forward<Fn>(fn), meter);
  } catch (const std::exception& ex) {
    spdlog::warn("External call to {} raised: {}",
                 cadence::schema::to_hex(target), ex.what());
    return false;
  } catch (...) {
    spdlog::warn("External call to {} raised a non-standard exception",
                 cadence::schema::to_hex(target));
    return false;
  }
  if (ok && meter.exhausted()) {
    spdlog::warn("External call to {} exhausted its fee budget {}",
                 cadence::schema::to_hex(target), fee_budget);
    return false;
  }
  return ok;
}

}  // namespace cadence::gateway
