#include <cadence/schema/encoding/scale/vault_meta.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const vault_meta<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_amount(o.balance, encoder);
  encode(o.next_transaction_id, encoder);
  encode(o.next_subscription_id, encoder);
  encode(o.next_event_id, encoder);
}

void decode(vault_meta<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode_amount(o.balance, decoder);
  decode(o.next_transaction_id, decoder);
  decode(o.next_subscription_id, decoder);
  decode(o.next_event_id, decoder);
}

}  // namespace cadence::schema
