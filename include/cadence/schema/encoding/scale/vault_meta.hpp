#pragma once
#include <cadence/schema/encoding/scale/primitives.hpp>
#include <cadence/schema/vault_meta.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const vault_meta<1>& o, ::scale::Encoder& encoder);
void decode(vault_meta<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
