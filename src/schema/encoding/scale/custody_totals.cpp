#include <stakeline/schema/encoding/scale/custody_totals.hpp>

namespace stakeline::schema {

void encode(const custody_totals<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.pending, encoder);
  encode(o.committed, encoder);
  encode(o.exited, encoder);
  encode(o.held, encoder);
}

void decode(custody_totals<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.pending, decoder);
  decode(o.committed, decoder);
  decode(o.exited, decoder);
  decode(o.held, decoder);
}

}  // namespace stakeline::schema
