#include <cadence/schema/encoding/scale/subscription_state.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const subscription_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subscription_id, encoder);
  encode(o.destination, encoder);
  encode(o.recipient, encoder);
  encode(o.token, encoder);
  encode(o.settlement_wallet, encoder);
  encode_amount(o.value, encoder);
  encode(o.variant, encoder);
  encode(o.created, encoder);
  encode(o.expires, encoder);
  encode(o.cycle, encoder);
  encode(o.period, encoder);
  encode(o.withdraw_prev, encoder);
  encode(o.withdraw_next, encoder);
  encode(o.external_id, encoder);
  encode(o.payload, encoder);
  encode(o.metadata, encoder);
  encode(o.paused, encoder);
}

void decode(subscription_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subscription_id, decoder);
  decode(o.destination, decoder);
  decode(o.recipient, decoder);
  decode(o.token, decoder);
  decode(o.settlement_wallet, decoder);
  decode_amount(o.value, decoder);
  decode(o.variant, decoder);
  decode(o.created, decoder);
  decode(o.expires, decoder);
  decode(o.cycle, decoder);
  decode(o.period, decoder);
  decode(o.withdraw_prev, decoder);
  decode(o.withdraw_next, decoder);
  decode(o.external_id, decoder);
  decode(o.payload, decoder);
  decode(o.metadata, decoder);
  decode(o.paused, decoder);
}

}  // namespace cadence::schema
