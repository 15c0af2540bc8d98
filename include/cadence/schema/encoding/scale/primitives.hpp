#pragma once
#include <cadence/schema/event_type.hpp>
#include <cadence/schema/primitives.hpp>
#include <cadence/schema/settlement_variant.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

// amount_t travels as 32 little-endian bytes. Named helpers rather than
// encode/decode overloads: amount_t converts implicitly from every integer.
void encode_amount(const amount_t& o, ::scale::Encoder& encoder);
void decode_amount(amount_t& o, ::scale::Decoder& decoder);

void encode(const settlement_variant_t& o, ::scale::Encoder& encoder);
void decode(settlement_variant_t& o, ::scale::Decoder& decoder);

void encode(const event_type_t& o, ::scale::Encoder& encoder);
void decode(event_type_t& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
