#include <stakeline/schema/encoding/scale/app_info.hpp>

namespace stakeline::schema {

void encode(const app_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.schema_version, encoder);
  encode(o.data, encoder);
  encode(o.version, encoder);
  encode(o.last_committed_height, encoder);
  encode(o.last_committed_state_root, encoder);
}

void decode(app_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.schema_version, decoder);
  decode(o.data, decoder);
  decode(o.version, decoder);
  decode(o.last_committed_height, decoder);
  decode(o.last_committed_state_root, decoder);
}

}  // namespace stakeline::schema
