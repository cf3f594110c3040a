#pragma once

#include <string_view>

namespace stakeline::execution {

inline constexpr auto kDepositCodespace = std::string_view{"stakeline.deposit"};
inline constexpr auto kExitCodespace = std::string_view{"stakeline.exit"};
inline constexpr auto kAdminCodespace = std::string_view{"stakeline.admin"};
inline constexpr auto kCustodyCodespace = std::string_view{"stakeline.custody"};
inline constexpr auto kQueryCodespace = std::string_view{"stakeline.query"};

}  // namespace stakeline::execution
