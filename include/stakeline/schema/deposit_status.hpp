#pragma once

#include <stakeline/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: deposit status.
// Validator lifecycle: requested -> assigned -> confirmed -> finalized, with
// cancelled reachable from every non-terminal status.
namespace stakeline::schema {

enum class deposit_status_t : uint8_t {
  none = 0,
  requested = 1,
  assigned = 2,
  confirmed = 3,
  finalized = 4,
  cancelled = 5
};

inline constexpr auto kDepositStatusMappings =
    enum_mappings_t<deposit_status_t, 6>{
        std::pair{std::string_view{"none"}, deposit_status_t::none},
        std::pair{std::string_view{"requested"}, deposit_status_t::requested},
        std::pair{std::string_view{"assigned"}, deposit_status_t::assigned},
        std::pair{std::string_view{"confirmed"}, deposit_status_t::confirmed},
        std::pair{std::string_view{"finalized"}, deposit_status_t::finalized},
        std::pair{std::string_view{"cancelled"}, deposit_status_t::cancelled}};

inline constexpr std::string_view to_string(const deposit_status_t value) {
  return to_string(value, kDepositStatusMappings);
}

inline constexpr std::optional<deposit_status_t> try_deposit_status_from_string(
    const std::string_view value) {
  return from_string(value, kDepositStatusMappings);
}

}  // namespace stakeline::schema
