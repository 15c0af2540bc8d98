#include <cadence/schema/encoding/scale/call.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const submit_transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.destination, encoder);
  encode_amount(o.value, encoder);
  encode(o.payload, encoder);
}

void decode(submit_transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.destination, decoder);
  decode_amount(o.value, decoder);
  decode(o.payload, decoder);
}

void encode(const confirm_transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
}

void decode(confirm_transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
}

void encode(const revoke_confirmation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
}

void decode(revoke_confirmation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
}

void encode(const execute_transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
}

void decode(execute_transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
}

void encode(const submit_subscription<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.destination, encoder);
  encode(o.recipient, encoder);
  encode_amount(o.value, encoder);
  encode(o.period, encoder);
  encode(o.variant, encoder);
  encode(o.payload, encoder);
  encode(o.metadata, encoder);
}

void decode(submit_subscription<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.destination, decoder);
  decode(o.recipient, decoder);
  decode_amount(o.value, decoder);
  decode(o.period, decoder);
  decode(o.variant, decoder);
  decode(o.payload, decoder);
  decode(o.metadata, decoder);
}

void encode(const cancel_subscription<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subscription_id, encoder);
}

void decode(cancel_subscription<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subscription_id, decoder);
}

void encode(const pause_subscription<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subscription_id, encoder);
  encode(o.paused, encoder);
}

void decode(pause_subscription<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subscription_id, decoder);
  decode(o.paused, decoder);
}

void encode(const execute_subscription<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subscription_id, encoder);
}

void decode(execute_subscription<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subscription_id, decoder);
}

void encode(const deposit<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(deposit<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const call<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
  encode(o.caller, encoder);
  encode_amount(o.value, encoder);
  encode(o.payload, encoder);
}

void decode(call<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
  decode(o.caller, decoder);
  decode_amount(o.value, decoder);
  decode(o.payload, decoder);
}

}  // namespace cadence::schema
