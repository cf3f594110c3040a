#pragma once

#include <stakeline/execution/authorization_policy.hpp>
#include <stakeline/execution/collaborators.hpp>
#include <stakeline/execution/custody_ledger.hpp>
#include <stakeline/execution/journal.hpp>
#include <stakeline/execution/validator_set.hpp>
#include <stakeline/schema/exit_request.hpp>
#include <stakeline/schema/operation_result.hpp>

#include <map>

namespace stakeline::execution {

/// Async vault request book for both capital directions.
///
/// Requests move pending -> processing -> claimable -> claimed, or
/// pending -> cancelled. Operators act as keepers: they submit validator
/// deposits, start exits and report exits as processed. Owners and
/// controllers claim and cancel.
class exit_tracker final {
 public:
  struct context final {
    journal& undo;
    custody_ledger& ledger;
    authorization_policy& authorization;
    validator_set& validators;
    const collaborators_t& collaborators;
    stakeline::schema::amount_t stake_amount;
    uint64_t stake_gwei;
    stakeline::schema::address_t vault_withdrawal_address;
    stakeline::schema::hash32_t vault_withdrawal_credentials;
  };

  explicit exit_tracker(context ctx);

  stakeline::schema::operation_result_t request_deposit(
      const stakeline::schema::address_t& caller,
      const stakeline::schema::address_t& controller,
      const stakeline::schema::amount_t& payment);

  /// Keeper supplies validator credentials for a pending deposit request.
  /// Rejected with invalid_address while the vault withdrawal address is
  /// zero. The request is written as processing and the stake booked out
  /// before the deposit sink is called; it becomes claimable once the sink
  /// succeeds.
  stakeline::schema::operation_result_t process_validator_deposit(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id,
      const stakeline::schema::bytes_view_t& pubkey,
      const stakeline::schema::bytes_view_t& signature,
      const stakeline::schema::hash32_t& supplied_root);

  stakeline::schema::operation_result_t claim_deposit(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id);

  stakeline::schema::operation_result_t cancel_deposit_request(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id);

  /// Caller must own the validator; it stays locked to the request until
  /// the request is cancelled.
  stakeline::schema::operation_result_t request_redeem(
      const stakeline::schema::address_t& caller,
      const stakeline::schema::address_t& controller,
      stakeline::schema::validator_id_t validator_id);

  stakeline::schema::operation_result_t start_redeem(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id);

  stakeline::schema::operation_result_t process_redeem(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id,
      stakeline::schema::epoch_t exit_epoch);

  stakeline::schema::operation_result_t claim_redeem(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id);

  stakeline::schema::operation_result_t cancel_redeem(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id);

  const stakeline::schema::exit_request_t* find(
      stakeline::schema::request_id_t id) const;

  /// Deposit requests whose stake is still reserved.
  std::size_t reserved_deposit_count() const;
  /// Sum of claimable redeem amounts.
  stakeline::schema::amount_t claimable_redeem_total() const;

  const std::map<stakeline::schema::request_id_t,
                 stakeline::schema::exit_request_t>&
  requests() const {
    return requests_;
  }
  stakeline::schema::request_id_t next_id() const { return next_id_; }

  void restore(std::map<stakeline::schema::request_id_t,
                        stakeline::schema::exit_request_t> requests,
               stakeline::schema::request_id_t next_id);

 private:
  /// Looks up `id` and checks its kind; nullptr with `failure` set otherwise.
  const stakeline::schema::exit_request_t* lookup(
      stakeline::schema::request_id_t id,
      stakeline::schema::request_kind_t kind,
      std::string_view action,
      stakeline::schema::operation_result_t& failure) const;
  bool is_party(const stakeline::schema::exit_request_t& request,
                const stakeline::schema::address_t& caller) const;
  stakeline::schema::request_id_t allocate_id();
  void write(const stakeline::schema::exit_request_t& request);

  context context_;
  std::map<stakeline::schema::request_id_t, stakeline::schema::exit_request_t>
      requests_;
  stakeline::schema::request_id_t next_id_{1};
};

}  // namespace stakeline::execution
