#pragma once

#include <stakeline/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: vault request status.
// Both capital directions share one shape: pending -> processing ->
// claimable -> claimed, or pending -> cancelled.
namespace stakeline::schema {

enum class request_status_t : uint8_t {
  pending = 0,
  processing = 1,
  claimable = 2,
  claimed = 3,
  cancelled = 4
};

inline constexpr auto kRequestStatusMappings =
    enum_mappings_t<request_status_t, 5>{
        std::pair{std::string_view{"pending"}, request_status_t::pending},
        std::pair{std::string_view{"processing"}, request_status_t::processing},
        std::pair{std::string_view{"claimable"}, request_status_t::claimable},
        std::pair{std::string_view{"claimed"}, request_status_t::claimed},
        std::pair{std::string_view{"cancelled"}, request_status_t::cancelled}};

inline constexpr std::string_view to_string(const request_status_t value) {
  return to_string(value, kRequestStatusMappings);
}

enum class request_kind_t : uint8_t { deposit = 0, redeem = 1 };

inline constexpr auto kRequestKindMappings = enum_mappings_t<request_kind_t, 2>{
    std::pair{std::string_view{"deposit"}, request_kind_t::deposit},
    std::pair{std::string_view{"redeem"}, request_kind_t::redeem}};

inline constexpr std::string_view to_string(const request_kind_t value) {
  return to_string(value, kRequestKindMappings);
}

}  // namespace stakeline::schema
