#include <stakeline/execution/cancellation_policy.hpp>
#include <stakeline/execution/codespaces.hpp>
#include <stakeline/execution/state_machine.hpp>

#include <fmt/format.h>

using namespace stakeline::schema;

namespace stakeline::execution {

cancellation_policy::cancellation_policy(const duration_seconds_t cooldown)
    : cooldown_{cooldown} {}

duration_seconds_t cancellation_policy::remaining(
    const deposit_record_t& record,
    const timestamp_seconds_t now) const {
  if (record.status != deposit_status_t::confirmed) {
    return 0;
  }
  auto unlock_at = record.confirmed_at + cooldown_;
  return now >= unlock_at ? 0 : unlock_at - now;
}

operation_result_t cancellation_policy::evaluate(
    const deposit_record_t& record,
    const timestamp_seconds_t now) const {
  if (!next_status(record.status, deposit_action_t::cancel)) {
    return make_error(
        error_code::state_violation, kDepositCodespace,
        describe_state_violation(deposit_action_t::cancel, record.status));
  }
  auto wait = remaining(record, now);
  if (wait > 0) {
    return make_error(error_code::cooldown_active, kDepositCodespace,
                      fmt::format("remaining_seconds={}", wait));
  }
  return {};
}

}  // namespace stakeline::execution
