#pragma once
#include <stakeline/schema/validator_record.hpp>
#include <stakeline/schema/encoding/scale/validator_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace stakeline::schema {

void encode(const validator_record<1>& o, ::scale::Encoder& encoder);
void decode(validator_record<1>& o, ::scale::Decoder& decoder);

}  // namespace stakeline::schema
