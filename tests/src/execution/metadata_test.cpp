#include <cadence/execution/metadata.hpp>
#include <cadence/testing/common.hpp>
#include <gtest/gtest.h>

using cadence::execution::decode_subscription_metadata;
using cadence::execution::encode_subscription_metadata;
using cadence::execution::subscription_terms;
using cadence::schema::error_code_t;
using cadence::schema::settlement_variant_t;
using cadence::testing::make_account;
using cadence::testing::make_hash;

TEST(metadata, direct_escrow_needs_three_fields_and_zero_token) {
  auto terms = subscription_terms{.external_id = make_hash(4)};
  auto metadata =
      encode_subscription_metadata(settlement_variant_t::direct_escrow, terms);
  ASSERT_EQ(metadata.size(), 3u);

  auto error = error_code_t::ok;
  auto decoded = decode_subscription_metadata(
      settlement_variant_t::direct_escrow, metadata, 100, error);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(error, error_code_t::ok);
  EXPECT_EQ(decoded->external_id, make_hash(4));
  EXPECT_EQ(decoded->expires, cadence::schema::kNoExpiry);

  metadata[1] = cadence::schema::bytes_t(32, 0x01);
  EXPECT_FALSE(decode_subscription_metadata(settlement_variant_t::direct_escrow,
                                            metadata, 100, error)
                   .has_value());
  EXPECT_EQ(error, error_code_t::invalid_metadata);
}

TEST(metadata, delegated_allowance_needs_settlement_wallet) {
  auto terms = subscription_terms{.external_id = make_hash(4),
                                  .token = make_account(0xC0),
                                  .expires = 500,
                                  .settlement_wallet = make_account(0xE0)};
  auto metadata = encode_subscription_metadata(
      settlement_variant_t::delegated_allowance, terms);
  ASSERT_EQ(metadata.size(), 4u);

  auto error = error_code_t::ok;
  auto decoded = decode_subscription_metadata(
      settlement_variant_t::delegated_allowance, metadata, 100, error);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->expires, 500u);
  EXPECT_EQ(decoded->settlement_wallet, make_account(0xE0));

  metadata.pop_back();
  EXPECT_FALSE(decode_subscription_metadata(
                   settlement_variant_t::delegated_allowance, metadata, 100,
                   error)
                   .has_value());
  EXPECT_EQ(error, error_code_t::invalid_metadata);

  metadata.push_back(cadence::schema::bytes_t(32, 0x00));
  EXPECT_FALSE(decode_subscription_metadata(
                   settlement_variant_t::delegated_allowance, metadata, 100,
                   error)
                   .has_value());
}

TEST(metadata, token_variants_need_token) {
  auto terms = subscription_terms{.external_id = make_hash(4)};
  auto metadata =
      encode_subscription_metadata(settlement_variant_t::escrow_token, terms);
  auto error = error_code_t::ok;
  EXPECT_FALSE(decode_subscription_metadata(settlement_variant_t::escrow_token,
                                            metadata, 100, error)
                   .has_value());
  EXPECT_EQ(error, error_code_t::invalid_metadata);
}

TEST(metadata, expiry_must_be_in_the_future) {
  auto terms = subscription_terms{.external_id = make_hash(4), .expires = 100};
  auto metadata =
      encode_subscription_metadata(settlement_variant_t::direct_escrow, terms);
  auto error = error_code_t::ok;
  EXPECT_FALSE(decode_subscription_metadata(settlement_variant_t::direct_escrow,
                                            metadata, 100, error)
                   .has_value());
  EXPECT_TRUE(decode_subscription_metadata(settlement_variant_t::direct_escrow,
                                           metadata, 99, error)
                  .has_value());
}

TEST(metadata, malformed_fields_are_rejected) {
  auto error = error_code_t::ok;
  auto metadata = std::vector<cadence::schema::bytes_t>{
      cadence::schema::bytes_t(31, 0x01), cadence::schema::bytes_t(32, 0x00),
      cadence::schema::bytes_t(8, 0x00)};
  EXPECT_FALSE(decode_subscription_metadata(settlement_variant_t::direct_escrow,
                                            metadata, 1, error)
                   .has_value());
  EXPECT_EQ(error, error_code_t::invalid_metadata);

  metadata[0] = cadence::schema::bytes_t(32, 0x01);
  metadata[2] = cadence::schema::bytes_t(4, 0x00);
  EXPECT_FALSE(decode_subscription_metadata(settlement_variant_t::direct_escrow,
                                            metadata, 1, error)
                   .has_value());
}

TEST(metadata, unknown_variant_is_unsupported) {
  auto error = error_code_t::ok;
  EXPECT_FALSE(decode_subscription_metadata(
                   static_cast<settlement_variant_t>(7), {}, 1, error)
                   .has_value());
  EXPECT_EQ(error, error_code_t::unsupported_variant);
}
