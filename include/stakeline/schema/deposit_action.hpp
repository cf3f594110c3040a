#pragma once

#include <stakeline/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace stakeline::schema {

enum class deposit_action_t : uint8_t {
  create = 0,
  assign = 1,
  confirm = 2,
  finalize = 3,
  cancel = 4
};

inline constexpr auto kDepositActionMappings =
    enum_mappings_t<deposit_action_t, 5>{
        std::pair{std::string_view{"create"}, deposit_action_t::create},
        std::pair{std::string_view{"assign"}, deposit_action_t::assign},
        std::pair{std::string_view{"confirm"}, deposit_action_t::confirm},
        std::pair{std::string_view{"finalize"}, deposit_action_t::finalize},
        std::pair{std::string_view{"cancel"}, deposit_action_t::cancel}};

inline constexpr std::string_view to_string(const deposit_action_t value) {
  return to_string(value, kDepositActionMappings);
}

}  // namespace stakeline::schema
