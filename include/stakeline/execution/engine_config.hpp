#pragma once

#include <stakeline/execution/cancellation_policy.hpp>
#include <stakeline/schema/primitives.hpp>

#include <vector>

namespace stakeline::execution {

/// Startup configuration. `owner` and `operators` seed a fresh database; once
/// state has been committed the persisted values win.
struct engine_config final {
  stakeline::schema::address_t owner{};
  std::vector<stakeline::schema::address_t> operators;
  /// Wei; must be a whole number of gwei.
  stakeline::schema::amount_t stake_amount{stakeline::schema::kStakeAmount};
  stakeline::schema::duration_seconds_t cancellation_cooldown{
      kDefaultCancellationCooldown};
  /// Execution address the vault's validators withdraw to.
  stakeline::schema::address_t vault_withdrawal_address{};
};

}  // namespace stakeline::execution
