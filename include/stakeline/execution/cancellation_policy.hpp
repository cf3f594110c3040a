#pragma once

#include <stakeline/schema/deposit_record.hpp>
#include <stakeline/schema/operation_result.hpp>
#include <stakeline/schema/primitives.hpp>

namespace stakeline::execution {

/// Seven days.
inline constexpr auto kDefaultCancellationCooldown =
    stakeline::schema::duration_seconds_t{604800};

/// Time-gated early exit for deposit records.
///
/// Requested and assigned records may be cancelled at once; a confirmed
/// record only once `cooldown` seconds have passed since confirmation.
class cancellation_policy final {
 public:
  explicit cancellation_policy(
      stakeline::schema::duration_seconds_t cooldown =
          kDefaultCancellationCooldown);

  stakeline::schema::duration_seconds_t cooldown() const { return cooldown_; }

  /// Seconds until a confirmed record becomes cancellable; 0 otherwise.
  stakeline::schema::duration_seconds_t remaining(
      const stakeline::schema::deposit_record_t& record,
      stakeline::schema::timestamp_seconds_t now) const;

  /// ok, `state_violation` for none/finalized/cancelled, or
  /// `cooldown_active` with the remaining seconds in `info`.
  stakeline::schema::operation_result_t evaluate(
      const stakeline::schema::deposit_record_t& record,
      stakeline::schema::timestamp_seconds_t now) const;

 private:
  stakeline::schema::duration_seconds_t cooldown_;
};

}  // namespace stakeline::execution
