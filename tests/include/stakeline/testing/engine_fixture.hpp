#pragma once

#include <stakeline/crypto/deposit_data_root.hpp>
#include <stakeline/execution/engine.hpp>
#include <stakeline/schema/encoding/scale/encoder.hpp>
#include <stakeline/schema/primitives.hpp>
#include <stakeline/storage/rocksdb/storage.hpp>
#include <stakeline/testing/common.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stakeline::testing {

using scale_encoder_t = stakeline::schema::encoding::scale_encoder_t;

/// Deposit sink, value transfer and clock that record every call.
struct recording_collaborators final {
  std::vector<stakeline::execution::deposit_call_t> deposits;
  std::vector<std::pair<stakeline::schema::address_t,
                        stakeline::schema::amount_t>>
      transfers;
  stakeline::schema::timestamp_seconds_t now{1'700'000'000};
  bool fail_deposits{false};
  bool fail_transfers{false};
  /// Runs inside the sink before it reports, to model re-entrant callers.
  std::function<void()> on_deposit;
  std::function<void()> on_transfer;

  stakeline::execution::collaborators_t bind() {
    auto out = stakeline::execution::collaborators_t{};
    out.deposit_sink = [this](const stakeline::execution::deposit_call_t& call) {
      if (on_deposit) {
        on_deposit();
      }
      if (fail_deposits) {
        return false;
      }
      deposits.push_back(call);
      return true;
    };
    out.value_transfer = [this](const stakeline::schema::address_t& to,
                                const stakeline::schema::amount_t& amount) {
      if (on_transfer) {
        on_transfer();
      }
      if (fail_transfers) {
        return false;
      }
      transfers.emplace_back(to, amount);
      return true;
    };
    out.clock = [this]() { return now; };
    return out;
  }
};

class engine_fixture final {
 public:
  static constexpr auto kOwnerSeed = uint8_t{0x01};
  static constexpr auto kOperatorSeed = uint8_t{0x30};
  static constexpr auto kVaultSeed = uint8_t{0xC0};

  explicit engine_fixture(const std::string_view db_prefix)
      : engine_fixture{db_prefix, [](stakeline::execution::engine_config&) {}} {}

  /// `configure` adjusts the default configuration before the engine opens.
  engine_fixture(
      const std::string_view db_prefix,
      const std::function<void(stakeline::execution::engine_config&)>&
          configure)
      : db_path_{make_db_path(db_prefix)} {
    config_.owner = make_address(kOwnerSeed);
    config_.operators = {make_address(kOperatorSeed)};
    config_.vault_withdrawal_address = make_address(kVaultSeed);
    configure(config_);
    open();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    close();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  stakeline::execution::engine& engine() { return *engine_; }
  recording_collaborators& fakes() { return fakes_; }
  stakeline::storage::rocksdb_storage_t& storage() { return *storage_; }
  const stakeline::execution::engine_config& config() const { return config_; }

  stakeline::schema::address_t owner() const { return config_.owner; }
  stakeline::schema::address_t keeper() const {
    return make_address(kOperatorSeed);
  }
  stakeline::schema::amount_t stake() const { return config_.stake_amount; }

  /// Drop the engine and database handle, then load the database again.
  void reopen() {
    close();
    open();
  }

  void advance(const stakeline::schema::duration_seconds_t seconds) {
    fakes_.now += seconds;
  }

  uint64_t decode_id(const stakeline::schema::operation_result_t& result) {
    return encoder_.decode<uint64_t>(
        stakeline::schema::make_bytes_view(result.data));
  }

  stakeline::schema::hash32_t root_for(
      const stakeline::schema::bls_pubkey_t& pubkey,
      const stakeline::schema::hash32_t& withdrawal_credentials,
      const stakeline::schema::bls_signature_t& signature) const {
    return *stakeline::crypto::deposit_data_root(
        pubkey, withdrawal_credentials, signature,
        *stakeline::crypto::to_gwei(config_.stake_amount));
  }

  stakeline::schema::hash32_t vault_root(
      const stakeline::schema::bls_pubkey_t& pubkey,
      const stakeline::schema::bls_signature_t& signature) const {
    return root_for(pubkey,
                    stakeline::crypto::make_withdrawal_credentials(
                        config_.vault_withdrawal_address),
                    signature);
  }

  /// create -> assign with keys derived from `seed`. Returns the record id.
  uint64_t create_assigned(const stakeline::schema::address_t& depositor,
                           const stakeline::schema::address_t& withdrawal,
                           const uint8_t seed) {
    auto created = engine_->create(depositor, withdrawal, stake());
    auto id = decode_id(created);
    auto pubkey = make_pubkey(seed);
    auto signature = make_signature(seed);
    engine_->assign(keeper(), id, pubkey, signature);
    return id;
  }

  /// create -> assign -> confirm. Returns the record id.
  uint64_t create_confirmed(const stakeline::schema::address_t& depositor,
                            const stakeline::schema::address_t& withdrawal,
                            const uint8_t seed) {
    auto id = create_assigned(depositor, withdrawal, seed);
    auto record = engine_->deposit(id);
    engine_->confirm(withdrawal, id,
                     root_for(record->pubkey, record->withdrawal_credentials,
                              record->signature));
    return id;
  }

  /// Full deposit lifecycle. Returns the validator id.
  uint64_t create_finalized(const stakeline::schema::address_t& depositor,
                            const stakeline::schema::address_t& withdrawal,
                            const uint8_t seed) {
    auto id = create_confirmed(depositor, withdrawal, seed);
    return decode_id(engine_->finalize(keeper(), id));
  }

 private:
  void open() {
    storage_.emplace(stakeline::storage::make_storage<
                     stakeline::storage::rocksdb_storage_tag>(db_path_));
    engine_.emplace(encoder_, *storage_, config_, fakes_.bind());
  }

  void close() {
    engine_.reset();
    storage_.reset();
  }

  std::string db_path_;
  scale_encoder_t encoder_{};
  stakeline::execution::engine_config config_{};
  recording_collaborators fakes_{};
  std::optional<stakeline::storage::rocksdb_storage_t> storage_;
  std::optional<stakeline::execution::engine> engine_;
};

}  // namespace stakeline::testing
