#pragma once
#include <cadence/common/critical.hpp>
#include <cadence/schema/encoding/encoder.hpp>
#include <cadence/schema/encoding/scale/call.hpp>
#include <cadence/schema/encoding/scale/confirmation_state.hpp>
#include <cadence/schema/encoding/scale/event_record.hpp>
#include <cadence/schema/encoding/scale/owner_set_state.hpp>
#include <cadence/schema/encoding/scale/primitives.hpp>
#include <cadence/schema/encoding/scale/subscription_state.hpp>
#include <cadence/schema/encoding/scale/transaction_state.hpp>
#include <cadence/schema/encoding/scale/vault_call.hpp>
#include <cadence/schema/encoding/scale/vault_meta.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace cadence::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  cadence::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cadence::schema::bytes_t& out);

  template <typename T>
  T decode(const cadence::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cadence::schema::bytes_view_t& bytes);
};

template <typename T>
cadence::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    cadence::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        cadence::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const cadence::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    cadence::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const cadence::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace cadence::schema::encoding

namespace cadence::schema {

using scale_encoder_t =
    cadence::schema::encoding::encoder<cadence::schema::encoding::scale_encoder_tag>;

}  // namespace cadence::schema
