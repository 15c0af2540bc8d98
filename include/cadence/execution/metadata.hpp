#pragma once

#include <cadence/schema/error_code.hpp>
#include <cadence/schema/primitives.hpp>
#include <cadence/schema/settlement_variant.hpp>
#include <optional>
#include <vector>

namespace cadence::execution {

inline constexpr auto kExternalIdField = std::size_t{0};
inline constexpr auto kTokenField = std::size_t{1};
inline constexpr auto kExpiresField = std::size_t{2};
inline constexpr auto kSettlementWalletField = std::size_t{3};

/// Settlement terms carried by a subscription's ordered metadata fields.
struct subscription_terms final {
  cadence::schema::hash32_t external_id{};
  cadence::schema::account_id_t token{};
  cadence::schema::timestamp_milliseconds_t expires{cadence::schema::kNoExpiry};
  cadence::schema::account_id_t settlement_wallet{};
};

/// Number of metadata fields a variant requires, or std::nullopt for a
/// variant the vault does not know.
std::optional<std::size_t> required_metadata_fields(
    cadence::schema::settlement_variant_t variant);

/// Decode and validate metadata for `variant` at time `now`.
///
/// On failure `error` is set to `invalid_metadata` or `unsupported_variant`
/// and std::nullopt is returned.
std::optional<subscription_terms> decode_subscription_metadata(
    cadence::schema::settlement_variant_t variant,
    const std::vector<cadence::schema::bytes_t>& metadata,
    cadence::schema::timestamp_milliseconds_t now,
    cadence::schema::error_code_t& error);

/// Inverse of decode_subscription_metadata; used by tools and tests to build
/// well-formed submissions.
std::vector<cadence::schema::bytes_t> encode_subscription_metadata(
    cadence::schema::settlement_variant_t variant,
    const subscription_terms& terms);

}  // namespace cadence::execution
