#pragma once
#include <cadence/schema/confirmation_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const confirmation_state<1>& o, ::scale::Encoder& encoder);
void decode(confirmation_state<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
