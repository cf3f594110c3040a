#pragma once

#include <stakeline/schema/app_info.hpp>
#include <scale/scale.hpp>

namespace stakeline::schema {

void encode(const app_info<1>& o, ::scale::Encoder& encoder);
void decode(app_info<1>& o, ::scale::Decoder& decoder);

}  // namespace stakeline::schema
