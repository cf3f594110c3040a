#pragma once
#include <stakeline/schema/primitives.hpp>

// Schema type: custody totals.
// Aggregate stake per lifecycle phase, in wei, plus the native balance the
// engine actually holds.
namespace stakeline::schema {

template <uint16_t Version>
struct custody_totals;

template <>
struct custody_totals<1> final {
  uint16_t version{1};
  amount_t pending{};
  amount_t committed{};
  amount_t exited{};
  amount_t held{};
};

using custody_totals_t = custody_totals<1>;

}  // namespace stakeline::schema
