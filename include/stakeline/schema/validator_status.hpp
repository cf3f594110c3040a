#pragma once

#include <stakeline/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace stakeline::schema {

enum class validator_status_t : uint8_t { active = 0, exited = 1 };

/// Which flow funded the validator.
enum class validator_source_t : uint8_t { deposit_record = 0, vault_request = 1 };

inline constexpr auto kValidatorStatusMappings =
    enum_mappings_t<validator_status_t, 2>{
        std::pair{std::string_view{"active"}, validator_status_t::active},
        std::pair{std::string_view{"exited"}, validator_status_t::exited}};

inline constexpr std::string_view to_string(const validator_status_t value) {
  return to_string(value, kValidatorStatusMappings);
}

}  // namespace stakeline::schema
