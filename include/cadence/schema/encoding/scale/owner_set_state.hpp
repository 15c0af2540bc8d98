#pragma once
#include <cadence/schema/owner_set_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const owner_set_state<1>& o, ::scale::Encoder& encoder);
void decode(owner_set_state<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
