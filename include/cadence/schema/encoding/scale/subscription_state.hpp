#pragma once
#include <cadence/schema/encoding/scale/primitives.hpp>
#include <cadence/schema/subscription_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const subscription_state<1>& o, ::scale::Encoder& encoder);
void decode(subscription_state<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
