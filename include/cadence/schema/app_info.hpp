#pragma once

#include <cadence/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace cadence::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t version{1};
  std::string data{"cadence-vault"};
  std::string app_version{"0.1.0"};
  account_id_t vault_id{};
  uint64_t event_count{};
  uint64_t transaction_count{};
  uint64_t subscription_count{};
  hash32_t state_root{};
};

using app_info_t = app_info<1>;

}  // namespace cadence::schema
