#pragma once
#include <stakeline/schema/deposit_record.hpp>
#include <stakeline/schema/encoding/scale/deposit_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace stakeline::schema {

void encode(const deposit_record<1>& o, ::scale::Encoder& encoder);
void decode(deposit_record<1>& o, ::scale::Decoder& decoder);

}  // namespace stakeline::schema
