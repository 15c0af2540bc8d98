#include <cadence/schema/encoding/scale/confirmation_state.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const confirmation_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.owner, encoder);
  encode(o.confirmed_at, encoder);
}

void decode(confirmation_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.owner, decoder);
  decode(o.confirmed_at, decoder);
}

}  // namespace cadence::schema
