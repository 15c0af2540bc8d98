#pragma once

#include <cadence/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: settlement variant.
// Recurring payments: how funds move when a subscription cycle executes.
namespace cadence::schema {

enum class settlement_variant_t : uint8_t {
  // Vault-held value is sent straight to the destination.
  direct_escrow = 0,
  // Vault-held token balance is moved by the token service.
  escrow_token = 1,
  // The token service moves funds out of a third-party settlement wallet
  // that granted the vault an allowance.
  delegated_allowance = 2
};

inline constexpr auto kSettlementVariantMappings = std::array{
    std::pair<std::string_view, settlement_variant_t>{
        "direct_escrow", settlement_variant_t::direct_escrow},
    std::pair<std::string_view, settlement_variant_t>{
        "escrow_token", settlement_variant_t::escrow_token},
    std::pair<std::string_view, settlement_variant_t>{
        "delegated_allowance", settlement_variant_t::delegated_allowance}};

template <>
inline std::optional<settlement_variant_t>
try_from_string<settlement_variant_t>(const std::string_view value) {
  return from_string(value, kSettlementVariantMappings);
}

inline constexpr std::string_view to_string(const settlement_variant_t value) {
  return to_string(value, kSettlementVariantMappings).value_or("unknown");
}

inline constexpr bool is_known(const settlement_variant_t value) {
  return from_underlying(static_cast<uint8_t>(value),
                         kSettlementVariantMappings)
      .has_value();
}

}  // namespace cadence::schema
