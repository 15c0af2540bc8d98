#pragma once
#include <cadence/schema/encoding/scale/primitives.hpp>
#include <cadence/schema/call.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cadence::schema {

void encode(const submit_transaction<1>& o, ::scale::Encoder& encoder);
void decode(submit_transaction<1>& o, ::scale::Decoder& decoder);

void encode(const confirm_transaction<1>& o, ::scale::Encoder& encoder);
void decode(confirm_transaction<1>& o, ::scale::Decoder& decoder);

void encode(const revoke_confirmation<1>& o, ::scale::Encoder& encoder);
void decode(revoke_confirmation<1>& o, ::scale::Decoder& decoder);

void encode(const execute_transaction<1>& o, ::scale::Encoder& encoder);
void decode(execute_transaction<1>& o, ::scale::Decoder& decoder);

void encode(const submit_subscription<1>& o, ::scale::Encoder& encoder);
void decode(submit_subscription<1>& o, ::scale::Decoder& decoder);

void encode(const cancel_subscription<1>& o, ::scale::Encoder& encoder);
void decode(cancel_subscription<1>& o, ::scale::Decoder& decoder);

void encode(const pause_subscription<1>& o, ::scale::Encoder& encoder);
void decode(pause_subscription<1>& o, ::scale::Decoder& decoder);

void encode(const execute_subscription<1>& o, ::scale::Encoder& encoder);
void decode(execute_subscription<1>& o, ::scale::Decoder& decoder);

void encode(const deposit<1>& o, ::scale::Encoder& encoder);
void decode(deposit<1>& o, ::scale::Decoder& decoder);

void encode(const call<1>& o, ::scale::Encoder& encoder);
void decode(call<1>& o, ::scale::Decoder& decoder);

}  // namespace cadence::schema
