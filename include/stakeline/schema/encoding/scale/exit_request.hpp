#pragma once
#include <stakeline/schema/exit_request.hpp>
#include <stakeline/schema/encoding/scale/request_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace stakeline::schema {

void encode(const exit_request<1>& o, ::scale::Encoder& encoder);
void decode(exit_request<1>& o, ::scale::Decoder& decoder);

}  // namespace stakeline::schema
