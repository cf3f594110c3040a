#include <stakeline/schema/operation_result.hpp>

namespace stakeline::schema {

operation_result_t make_error(const error_code code,
                              const std::string_view codespace,
                              std::string info) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace stakeline::schema
