#include <cadence/schema/encoding/scale/owner_set_state.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const owner_set_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owners, encoder);
  encode(o.required, encoder);
}

void decode(owner_set_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owners, decoder);
  decode(o.required, decoder);
}

}  // namespace cadence::schema
