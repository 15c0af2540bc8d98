#include <cadence/schema/encoding/scale/vault_call.hpp>
#include <scale/scale.hpp>

namespace cadence::schema {

using ::scale::decode;
using ::scale::encode;

void encode(const add_owner<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
}

void decode(add_owner<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
}

void encode(const remove_owner<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
}

void decode(remove_owner<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
}

void encode(const replace_owner<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.new_owner, encoder);
}

void decode(replace_owner<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.new_owner, decoder);
}

void encode(const change_requirement<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.required, encoder);
}

void decode(change_requirement<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.required, decoder);
}

}  // namespace cadence::schema
