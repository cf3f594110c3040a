#pragma once
#include <stakeline/schema/custody_totals.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace stakeline::schema {

void encode(const custody_totals<1>& o, ::scale::Encoder& encoder);
void decode(custody_totals<1>& o, ::scale::Decoder& decoder);

}  // namespace stakeline::schema
