#include <cadence/gateway/gateway.hpp>

namespace cadence::gateway {

external_call_gateway::external_call_gateway(const uint32_t max_depth)
    : max_depth_{max_depth} {}

void external_call_gateway::bind(const cadence::schema::account_id_t& account,
                                 std::shared_ptr<principal> code) {
  principals_[account] = std::move(code);
}

void external_call_gateway::unbind(
    const cadence::schema::account_id_t& account) {
  principals_.erase(account);
}

bool external_call_gateway::is_bound(
    const cadence::schema::account_id_t& account) const {
  return principals_.contains(account);
}

bool external_call_gateway::call(const call_request& request) {
  // Hold a reference for the duration of the call; the callee may unbind
  // itself while running.
  auto code = std::shared_ptr<principal>{};
  if (auto it = principals_.find(request.to); it != std::end(principals_)) {
    code = it->second;
  }

  auto ok = invoke(request.to, request.fee_budget, [&](fee_meter& meter) {
    if (!code) {
      return true;
    }
    return code->on_call(request, meter);
  });
  if (ok && request.value > 0) {
    delivered_[request.to] += request.value;
  }
  spdlog::debug("Call {} -> {} value={} ok={}",
                cadence::schema::to_hex(request.from),
                cadence::schema::to_hex(request.to), request.value.str(), ok);
  return ok;
}

cadence::schema::amount_t external_call_gateway::delivered(
    const cadence::schema::account_id_t& account) const {
  if (auto it = delivered_.find(account); it != std::end(delivered_)) {
    return it->second;
  }
  return cadence::schema::amount_t{};
}

}  // namespace cadence::gateway
