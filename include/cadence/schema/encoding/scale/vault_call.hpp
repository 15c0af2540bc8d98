#pragma once
#include <cadence/schema/vault_call.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const add_owner<1>& o, ::scale::Encoder& encoder);
void decode(add_owner<1>& o, ::scale::Decoder& decoder);

void encode(const remove_owner<1>& o, ::scale::Encoder& encoder);
void decode(remove_owner<1>& o, ::scale::Decoder& decoder);

void encode(const replace_owner<1>& o, ::scale::Encoder& encoder);
void decode(replace_owner<1>& o, ::scale::Decoder& decoder);

void encode(const change_requirement<1>& o, ::scale::Encoder& encoder);
void decode(change_requirement<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
