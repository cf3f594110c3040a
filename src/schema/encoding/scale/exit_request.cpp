#include <stakeline/schema/encoding/scale/exit_request.hpp>

namespace stakeline::schema {

void encode(const exit_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.kind, encoder);
  encode(o.status, encoder);
  encode(o.amount, encoder);
  encode(o.owner, encoder);
  encode(o.controller, encoder);
  encode(o.validator_id, encoder);
  encode(o.pubkey, encoder);
  encode(o.signature, encoder);
  encode(o.committed_root, encoder);
  encode(o.exit_epoch, encoder);
  encode(o.created_at, encoder);
}

void decode(exit_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.kind, decoder);
  decode(o.status, decoder);
  decode(o.amount, decoder);
  decode(o.owner, decoder);
  decode(o.controller, decoder);
  decode(o.validator_id, decoder);
  decode(o.pubkey, decoder);
  decode(o.signature, decoder);
  decode(o.committed_root, decoder);
  decode(o.exit_epoch, decoder);
  decode(o.created_at, decoder);
}

}  // namespace stakeline::schema
