#pragma once

#include <stakeline/execution/authorization_policy.hpp>
#include <stakeline/execution/cancellation_policy.hpp>
#include <stakeline/execution/collaborators.hpp>
#include <stakeline/execution/custody_ledger.hpp>
#include <stakeline/execution/deposit_registry.hpp>
#include <stakeline/execution/engine_config.hpp>
#include <stakeline/execution/exit_tracker.hpp>
#include <stakeline/execution/handle_registry.hpp>
#include <stakeline/execution/journal.hpp>
#include <stakeline/execution/validator_set.hpp>
#include <stakeline/schema/app_info.hpp>
#include <stakeline/schema/commit_result.hpp>
#include <stakeline/schema/encoding/scale/encoder.hpp>
#include <stakeline/schema/operation_result.hpp>
#include <stakeline/schema/primitives.hpp>
#include <stakeline/schema/query_result.hpp>
#include <stakeline/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace stakeline::execution {

/// Validator custody engine.
///
/// Owns the deposit registry, the vault request book and the custody ledger
/// behind one lock. Every mutating entry point runs inside a journal frame:
/// it either completes with all custody invariants holding or leaves no
/// trace. The lock is recursive so a collaborator that calls back into the
/// engine on the same thread reaches the status guards instead of
/// deadlocking.
class engine final {
 public:
  /// Load committed state from `storage`, or seed it from `config` when the
  /// database is empty. Invalid configuration is fatal.
  engine(stakeline::schema::encoding::scale_encoder_t& encoder,
         stakeline::storage::rocksdb_storage_t& storage,
         engine_config config,
         collaborators_t collaborators);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  // Deposit records.
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
      const stakeline::schema::hash32_t& deposit_data_root);
  stakeline::schema::operation_result_t finalize(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id);
  stakeline::schema::operation_result_t cancel(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id);
  stakeline::schema::operation_result_t transfer_handle(
      const stakeline::schema::address_t& caller,
      stakeline::schema::record_id_t id,
      const stakeline::schema::address_t& to);

  // Vault requests.
  stakeline::schema::operation_result_t request_deposit(
      const stakeline::schema::address_t& caller,
      const stakeline::schema::address_t& controller,
      const stakeline::schema::amount_t& payment);
  stakeline::schema::operation_result_t process_validator_deposit(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id,
      const stakeline::schema::bytes_view_t& pubkey,
      const stakeline::schema::bytes_view_t& signature,
      const stakeline::schema::hash32_t& deposit_data_root);
  stakeline::schema::operation_result_t claim_deposit(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id);
  stakeline::schema::operation_result_t cancel_deposit_request(
      const stakeline::schema::address_t& caller,
      stakeline::schema::request_id_t id);
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

  // Administration.
  stakeline::schema::operation_result_t set_operator(
      const stakeline::schema::address_t& caller,
      const stakeline::schema::address_t& address,
      bool enabled);

  // Reads.
  std::optional<stakeline::schema::deposit_record_t> deposit(
      stakeline::schema::record_id_t id) const;
  std::optional<stakeline::schema::exit_request_t> request(
      stakeline::schema::request_id_t id) const;
  std::optional<stakeline::schema::validator_record_t> validator(
      stakeline::schema::validator_id_t id) const;
  std::optional<stakeline::schema::address_t> handle_owner(
      stakeline::schema::record_id_t id) const;
  std::vector<stakeline::schema::deposit_record_t> deposits() const;
  std::vector<stakeline::schema::exit_request_t> requests() const;
  std::vector<stakeline::schema::validator_record_t> validators() const;
  stakeline::schema::custody_totals_t custody() const;
  stakeline::schema::address_t owner() const;
  bool is_operator(const stakeline::schema::address_t& address) const;

  /// Seconds until `id` becomes cancellable; 0 when it already is or the
  /// record is not in cooldown.
  stakeline::schema::duration_seconds_t cancellation_remaining(
      stakeline::schema::record_id_t id) const;

  /// Persist all state rows plus (height, state_root) in one write.
  stakeline::schema::commit_result_t commit();

  /// Latest committed height and state root.
  stakeline::schema::app_info_t info() const;

  /// SCALE-encoded read path for keepers. Routes: /deposit, /handle,
  /// /deposit/cancellable_in, /request, /validator (key: SCALE u64 id),
  /// /operator (key: address), /custody and /engine/info (no key).
  stakeline::schema::query_result_t query(
      std::string_view path,
      const stakeline::schema::bytes_view_t& key);

 private:
  template <typename Fn>
  stakeline::schema::operation_result_t run_atomic(std::string_view action,
                                                   Fn&& fn);

  /// Cross-check the ledger against the records it summarizes.
  stakeline::schema::operation_result_t verify_custody() const;

  /// Sorted (key, value) rows for the whole state keyspace.
  std::vector<stakeline::storage::key_value_entry_t> build_state_rows() const;
  void load_persisted_state();
  void seed_from_config();

  mutable std::recursive_mutex mutex_;
  stakeline::schema::encoding::scale_encoder_t& encoder_;
  stakeline::storage::rocksdb_storage_t& storage_;
  engine_config config_;
  collaborators_t collaborators_;
  uint64_t stake_gwei_{};
  journal journal_;
  custody_ledger ledger_;
  authorization_policy authorization_;
  handle_registry handles_;
  validator_set validators_;
  cancellation_policy cancellation_;
  deposit_registry deposits_;
  exit_tracker exits_;
  int64_t last_committed_height_{};
  stakeline::schema::hash32_t last_committed_state_root_{};
};

}  // namespace stakeline::execution
