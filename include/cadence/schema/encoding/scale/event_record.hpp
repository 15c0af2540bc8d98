#pragma once
#include <cadence/schema/encoding/scale/primitives.hpp>
#include <cadence/schema/event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(event_attribute<1>& o, ::scale::Decoder& decoder);

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
