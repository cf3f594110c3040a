#include <stakeline/execution/state_machine.hpp>

#include <fmt/format.h>

namespace stakeline::execution {

std::string required_statuses(const stakeline::schema::deposit_action_t action) {
  auto out = std::string{};
  for (const auto& transition : kDepositTransitions) {
    if (transition.action != action) {
      continue;
    }
    if (!out.empty()) {
      out.push_back('|');
    }
    out.append(stakeline::schema::to_string(transition.from));
  }
  return out;
}

std::string describe_state_violation(
    const stakeline::schema::deposit_action_t action,
    const stakeline::schema::deposit_status_t actual) {
  return fmt::format("{} requires {}; actual {}",
                     stakeline::schema::to_string(action),
                     required_statuses(action),
                     stakeline::schema::to_string(actual));
}

}  // namespace stakeline::execution
