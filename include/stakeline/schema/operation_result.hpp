#pragma once

#include <stakeline/schema/error_code.hpp>
#include <stakeline/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace stakeline::schema {

template <uint16_t Version>
struct operation_result;

/// Outcome of one engine entry point.
///
/// `code` is 0 on success. On failure `log` names the guard that failed and
/// `info` carries its specifics. `data` holds SCALE-encoded output, e.g. the
/// id allocated by create.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using operation_result_t = operation_result<1>;

operation_result_t make_error(error_code code,
                              std::string_view codespace,
                              std::string info);

}  // namespace stakeline::schema
