#include <stakeline/schema/encoding/scale/validator_record.hpp>

namespace stakeline::schema {

void encode(const validator_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.pubkey, encoder);
  encode(o.withdrawal_credentials, encoder);
  encode(o.owner, encoder);
  encode(o.source, encoder);
  encode(o.source_id, encoder);
  encode(o.status, encoder);
  encode(o.exit_epoch, encoder);
  encode(o.locked_by, encoder);
}

void decode(validator_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.pubkey, decoder);
  decode(o.withdrawal_credentials, decoder);
  decode(o.owner, decoder);
  decode(o.source, decoder);
  decode(o.source_id, decoder);
  decode(o.status, decoder);
  decode(o.exit_epoch, decoder);
  decode(o.locked_by, decoder);
}

}  // namespace stakeline::schema
