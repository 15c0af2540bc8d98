#include <spdlog/spdlog.h>
#include <cadence/execution/metadata.hpp>

#include <algorithm>
#include <iterator>

using namespace cadence::schema;

namespace cadence::execution {

namespace {

std::optional<timestamp_milliseconds_t> read_le_u64(const bytes_t& field) {
  if (field.size() != sizeof(uint64_t)) {
    return std::nullopt;
  }
  auto value = uint64_t{};
  for (auto i = std::size_t{0}; i < field.size(); ++i) {
    value |= static_cast<uint64_t>(field[i]) << (8u * i);
  }
  return value;
}

bytes_t write_le_u64(const uint64_t value) {
  auto out = bytes_t(sizeof(uint64_t));
  for (auto i = std::size_t{0}; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>((value >> (8u * i)) & 0xFFu);
  }
  return out;
}

bytes_t make_field(const hash32_t& value) {
  return bytes_t{std::begin(value), std::end(value)};
}

}  // namespace

std::optional<std::size_t> required_metadata_fields(
    const settlement_variant_t variant) {
  switch (variant) {
    case settlement_variant_t::direct_escrow:
    case settlement_variant_t::escrow_token:
      return 3;
    case settlement_variant_t::delegated_allowance:
      return 4;
  }
  return std::nullopt;
}

std::optional<subscription_terms> decode_subscription_metadata(
    const settlement_variant_t variant,
    const std::vector<bytes_t>& metadata,
    const timestamp_milliseconds_t now,
    error_code_t& error) {
  auto expected = required_metadata_fields(variant);
  if (!expected) {
    error = error_code_t::unsupported_variant;
    return std::nullopt;
  }
  error = error_code_t::invalid_metadata;
  if (metadata.size() != *expected) {
    spdlog::debug("Metadata for {} expects {} fields, got {}",
                  to_string(variant), *expected, metadata.size());
    return std::nullopt;
  }

  auto external_id = try_make_hash32(make_bytes_view(metadata[kExternalIdField]));
  auto token = try_make_hash32(make_bytes_view(metadata[kTokenField]));
  auto expires = read_le_u64(metadata[kExpiresField]);
  if (!external_id || !token || !expires) {
    return std::nullopt;
  }

  auto terms = subscription_terms{.external_id = *external_id,
                                  .token = *token,
                                  .expires = kNoExpiry,
                                  .settlement_wallet = {}};
  if (*expires != 0) {
    if (*expires <= now) {
      return std::nullopt;
    }
    terms.expires = *expires;
  }

  // Direct escrow moves the vault's own value; only token variants name a
  // token collaborator.
  if ((variant == settlement_variant_t::direct_escrow) != is_zero(terms.token)) {
    return std::nullopt;
  }

  if (variant == settlement_variant_t::delegated_allowance) {
    auto wallet =
        try_make_hash32(make_bytes_view(metadata[kSettlementWalletField]));
    if (!wallet || is_zero(*wallet)) {
      return std::nullopt;
    }
    terms.settlement_wallet = *wallet;
  }

  error = error_code_t::ok;
  return terms;
}

std::vector<bytes_t> encode_subscription_metadata(
    const settlement_variant_t variant,
    const subscription_terms& terms) {
  auto metadata = std::vector<bytes_t>{};
  metadata.push_back(make_field(terms.external_id));
  metadata.push_back(make_field(terms.token));
  metadata.push_back(
      write_le_u64(terms.expires == kNoExpiry ? 0 : terms.expires));
  if (variant == settlement_variant_t::delegated_allowance) {
    metadata.push_back(make_field(terms.settlement_wallet));
  }
  return metadata;
}

}  // namespace cadence::execution
