#include <cadence/schema/encoding/scale/transaction_state.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const transaction_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.destination, encoder);
  encode_amount(o.value, encoder);
  encode(o.payload, encoder);
  encode(o.executed, encoder);
  encode(o.submitted_by, encoder);
  encode(o.submitted_at, encoder);
}

void decode(transaction_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.destination, decoder);
  decode_amount(o.value, decoder);
  decode(o.payload, decoder);
  decode(o.executed, decoder);
  decode(o.submitted_by, decoder);
  decode(o.submitted_at, decoder);
}

}  // namespace cadence::schema
