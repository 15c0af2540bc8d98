#pragma once
#include <cadence/schema/encoding/scale/primitives.hpp>
#include <cadence/schema/transaction_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const transaction_state<1>& o, ::scale::Encoder& encoder);
void decode(transaction_state<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
