#pragma once

#include <stakeline/schema/deposit_action.hpp>
#include <stakeline/schema/deposit_status.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace stakeline::execution {

/// Who may perform a deposit action.
enum class deposit_actor_t : uint8_t {
  depositor,
  operator_set,
  credential_holder_or_handle_owner
};

struct deposit_transition final {
  stakeline::schema::deposit_status_t from;
  stakeline::schema::deposit_action_t action;
  stakeline::schema::deposit_status_t to;
};

// Every legal edge. Anything absent is a state violation.
inline constexpr auto kDepositTransitions = std::array<deposit_transition, 7>{
    deposit_transition{stakeline::schema::deposit_status_t::none,
                       stakeline::schema::deposit_action_t::create,
                       stakeline::schema::deposit_status_t::requested},
    deposit_transition{stakeline::schema::deposit_status_t::requested,
                       stakeline::schema::deposit_action_t::assign,
                       stakeline::schema::deposit_status_t::assigned},
    deposit_transition{stakeline::schema::deposit_status_t::assigned,
                       stakeline::schema::deposit_action_t::confirm,
                       stakeline::schema::deposit_status_t::confirmed},
    deposit_transition{stakeline::schema::deposit_status_t::confirmed,
                       stakeline::schema::deposit_action_t::finalize,
                       stakeline::schema::deposit_status_t::finalized},
    deposit_transition{stakeline::schema::deposit_status_t::requested,
                       stakeline::schema::deposit_action_t::cancel,
                       stakeline::schema::deposit_status_t::cancelled},
    deposit_transition{stakeline::schema::deposit_status_t::assigned,
                       stakeline::schema::deposit_action_t::cancel,
                       stakeline::schema::deposit_status_t::cancelled},
    deposit_transition{stakeline::schema::deposit_status_t::confirmed,
                       stakeline::schema::deposit_action_t::cancel,
                       stakeline::schema::deposit_status_t::cancelled}};

constexpr std::optional<stakeline::schema::deposit_status_t> next_status(
    const stakeline::schema::deposit_status_t from,
    const stakeline::schema::deposit_action_t action) {
  for (const auto& transition : kDepositTransitions) {
    if (transition.from == from && transition.action == action) {
      return transition.to;
    }
  }
  return std::nullopt;
}

constexpr bool is_terminal(const stakeline::schema::deposit_status_t status) {
  return status == stakeline::schema::deposit_status_t::finalized ||
         status == stakeline::schema::deposit_status_t::cancelled;
}

/// Holds reserved stake: requested, assigned or confirmed.
constexpr bool is_open(const stakeline::schema::deposit_status_t status) {
  return status != stakeline::schema::deposit_status_t::none &&
         !is_terminal(status);
}

constexpr deposit_actor_t required_actor(
    const stakeline::schema::deposit_action_t action) {
  switch (action) {
    case stakeline::schema::deposit_action_t::create:
      return deposit_actor_t::depositor;
    case stakeline::schema::deposit_action_t::assign:
    case stakeline::schema::deposit_action_t::finalize:
      return deposit_actor_t::operator_set;
    case stakeline::schema::deposit_action_t::confirm:
    case stakeline::schema::deposit_action_t::cancel:
      return deposit_actor_t::credential_holder_or_handle_owner;
  }
  return deposit_actor_t::operator_set;
}

/// "requested", or "requested|assigned|confirmed" for cancel.
std::string required_statuses(stakeline::schema::deposit_action_t action);

/// Info text for a failed status guard, e.g.
/// "finalize requires confirmed; actual assigned".
std::string describe_state_violation(
    stakeline::schema::deposit_action_t action,
    stakeline::schema::deposit_status_t actual);

}  // namespace stakeline::execution
