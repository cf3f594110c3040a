#pragma once

#include <stakeline/execution/authorization_policy.hpp>
#include <stakeline/execution/cancellation_policy.hpp>
#include <stakeline/execution/collaborators.hpp>
#include <stakeline/execution/custody_ledger.hpp>
#include <stakeline/execution/handle_registry.hpp>
#include <stakeline/execution/journal.hpp>
#include <stakeline/execution/validator_set.hpp>
#include <stakeline/schema/deposit_action.hpp>
#include <stakeline/schema/deposit_record.hpp>
#include <stakeline/schema/operation_result.hpp>

#include <map>

namespace stakeline::execution {

/// Deposit records moving requested -> assigned -> confirmed -> finalized.
///
/// Each operation checks, in order: the record exists, the caller may act,
/// the record is in the required status, then the inputs. A non-ok result
/// may leave partial writes in the journal for the caller to reject.
class deposit_registry final {
 public:
  struct context final {
    journal& undo;
    custody_ledger& ledger;
    authorization_policy& authorization;
    handle_registry& handles;
    validator_set& validators;
    const cancellation_policy& cancellation;
    const collaborators_t& collaborators;
    stakeline::schema::amount_t stake_amount;
    uint64_t stake_gwei;
  };

  explicit deposit_registry(context ctx);

  /// Fund a new record with exactly one stake unit. `data` carries the
  /// SCALE-encoded record id.
  stakeline::schema::operation_result_t create(
      const stakeline::schema::address_t& caller,
      const stakeline::schema::address_t& withdrawal_address,
      const stakeline::schema::amount_t& payment);

  stakeline::schema::operation_result_t assign(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id,
      const stakeline::schema::bytes_view_t& pubkey,
      const stakeline::schema::bytes_view_t& signature);

  stakeline::schema::operation_result_t confirm(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id,
      const stakeline::schema::hash32_t& supplied_root);

  /// Irrevocable. State is written before the deposit sink is called.
  stakeline::schema::operation_result_t finalize(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id);

  /// Refund the stake to the handle owner, delete the record and burn the
  /// handle.
  stakeline::schema::operation_result_t cancel(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id);

  /// Finalized records whose validator is active and not held by a redeem
  /// request; moves the validator's ownership with the handle.
  stakeline::schema::operation_result_t transfer_handle(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id,
      const stakeline::schema::address_t& to);

  const stakeline::schema::deposit_record_t* find(
      stakeline::schema::record_id_t id) const;

  /// Records holding reserved stake.
  std::size_t open_count() const;

  const std::map<stakeline::schema::record_id_t,
                 stakeline::schema::deposit_record_t>&
  records() const {
    return records_;
  }
  stakeline::schema::record_id_t next_id() const { return next_id_; }

  void restore(std::map<stakeline::schema::record_id_t,
                        stakeline::schema::deposit_record_t> records,
               stakeline::schema::record_id_t next_id);

 private:
  stakeline::schema::operation_result_t missing(
      stakeline::schema::deposit_action_t action) const;
  stakeline::schema::operation_result_t check_status(
      const stakeline::schema::deposit_record_t& record,
      stakeline::schema::deposit_action_t action) const;
  bool may_act(const stakeline::schema::deposit_record_t& record,
               stakeline::schema::deposit_action_t action,
               const stakeline::schema::address_t& caller) const;
  stakeline::schema::error_code check_transfer(
      stakeline::schema::record_id_t id) const;
  void write(const stakeline::schema::deposit_record_t& record);

  context context_;
  std::map<stakeline::schema::record_id_t, stakeline::schema::deposit_record_t>
      records_;
  stakeline::schema::record_id_t next_id_{1};
};

}  // namespace stakeline::execution
