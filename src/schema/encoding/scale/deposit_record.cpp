#include <stakeline/schema/encoding/scale/deposit_record.hpp>

namespace stakeline::schema {

void encode(const deposit_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.status, encoder);
  encode(o.owner, encoder);
  encode(o.withdrawal_address, encoder);
  encode(o.withdrawal_credentials, encoder);
  encode(o.pubkey, encoder);
  encode(o.signature, encoder);
  encode(o.committed_root, encoder);
  encode(o.assigned_operator, encoder);
  encode(o.committed_amount, encoder);
  encode(o.created_at, encoder);
  encode(o.confirmed_at, encoder);
  encode(o.validator_id, encoder);
}

void decode(deposit_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.status, decoder);
  decode(o.owner, decoder);
  decode(o.withdrawal_address, decoder);
  decode(o.withdrawal_credentials, decoder);
  decode(o.pubkey, decoder);
  decode(o.signature, decoder);
  decode(o.committed_root, decoder);
  decode(o.assigned_operator, decoder);
  decode(o.committed_amount, decoder);
  decode(o.created_at, decoder);
  decode(o.confirmed_at, decoder);
  decode(o.validator_id, decoder);
}

}  // namespace stakeline::schema
