#include <cadence/schema/encoding/scale/event_record.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
  encode(o.index, encoder);
}

void decode(event_attribute<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
  decode(o.index, decoder);
}

void encode(const event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.type, encoder);
  encode(o.recorded_at, encoder);
  encode(o.transaction_id, encoder);
  encode(o.subscription_id, encoder);
  encode(o.account, encoder);
  encode(o.attributes, encoder);
}

void decode(event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.type, decoder);
  decode(o.recorded_at, decoder);
  decode(o.transaction_id, decoder);
  decode(o.subscription_id, decoder);
  decode(o.account, decoder);
  decode(o.attributes, decoder);
}

}  // namespace cadence::schema
