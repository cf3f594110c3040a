#pragma once

#include <stakeline/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace stakeline::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"stakeline-validator-custody"};
  std::string version{"0.1.0"};
  int64_t last_committed_height{};
  hash32_t last_committed_state_root;
};

using app_info_t = app_info<1>;

}  // namespace stakeline::schema
