#include <cadence/schema/encoding/scale/primitives.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode_amount(const amount_t& o, ::scale::Encoder& encoder) {
  encode(to_le_bytes(o), encoder);
}

void decode_amount(amount_t& o, ::scale::Decoder& decoder) {
  auto bytes = std::array<uint8_t, 32>{};
  decode(bytes, decoder);
  o = from_le_bytes(bytes);
}

// Unknown discriminants are kept as-is; the engine rejects them with
// unsupported_variant rather than failing the whole decode.
void encode(const settlement_variant_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(settlement_variant_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<settlement_variant_t>(raw);
}

void encode(const event_type_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(event_type_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<event_type_t>(raw);
}

}  // namespace cadence::schema
