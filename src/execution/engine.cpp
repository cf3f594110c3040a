#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <stakeline/blake3/hash.hpp>
#include <stakeline/common/critical.hpp>
#include <stakeline/crypto/deposit_data_root.hpp>
#include <stakeline/execution/codespaces.hpp>
#include <stakeline/execution/engine.hpp>
#include <stakeline/execution/state_machine.hpp>
#include <stakeline/schema/key/engine_keys.hpp>
#include <tuple>
#include <utility>

#include <fmt/format.h>

using namespace stakeline::schema;

namespace {

using encoder_t = stakeline::schema::encoding::scale_encoder_t;
using sequences_t = std::tuple<record_id_t, request_id_t, validator_id_t>;

constexpr auto kOwnerRow = std::string_view{"OWNER"};
constexpr auto kCustodyRow = std::string_view{"CUSTODY"};
constexpr auto kSequencesRow = std::string_view{"SEQUENCES"};

uint64_t require_gwei(const amount_t& stake_amount) {
  auto gwei = stakeline::crypto::to_gwei(stake_amount);
  if (!gwei.has_value() || *gwei == 0) {
    stakeline::common::critical(
        "stake amount {} wei is not a positive whole number of gwei",
        to_string(stake_amount));
  }
  return *gwei;
}

template <typename T>
T decode_row(encoder_t& encoder,
             const stakeline::storage::key_value_entry_t& row) {
  auto decoded = encoder.try_decode<T>(make_bytes_view(row.second));
  if (!decoded.has_value()) {
    stakeline::common::critical("corrupt state row '{}'",
                                make_string(make_bytes_view(row.first)));
  }
  return std::move(decoded.value());
}

query_result_t query_error(const query_error_code code,
                           std::string log,
                           std::string info) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{stakeline::execution::kQueryCodespace};
  return result;
}

}  // namespace

namespace stakeline::execution {

engine::engine(encoder_t& encoder,
               stakeline::storage::rocksdb_storage_t& storage,
               engine_config config,
               collaborators_t collaborators)
    : encoder_{encoder},
      storage_{storage},
      config_{std::move(config)},
      collaborators_{std::move(collaborators)},
      stake_gwei_{require_gwei(config_.stake_amount)},
      journal_{},
      ledger_{journal_},
      authorization_{journal_, config_.owner},
      handles_{journal_},
      validators_{journal_},
      cancellation_{config_.cancellation_cooldown},
      deposits_{deposit_registry::context{
          journal_, ledger_, authorization_, handles_, validators_,
          cancellation_, collaborators_, config_.stake_amount, stake_gwei_}},
      exits_{exit_tracker::context{
          journal_, ledger_, authorization_, validators_, collaborators_,
          config_.stake_amount, stake_gwei_, config_.vault_withdrawal_address,
          stakeline::crypto::make_withdrawal_credentials(
              config_.vault_withdrawal_address)}} {
  auto lock = std::scoped_lock{mutex_};
  if (!collaborators_.clock) {
    collaborators_.clock = system_clock_source();
  }
  if (is_zero(config_.vault_withdrawal_address)) {
    spdlog::warn(
        "Vault withdrawal address is zero; vault validator deposits are "
        "disabled");
  }

  load_persisted_state();
  if (last_committed_height_ == 0) {
    seed_from_config();
  }
  spdlog::info(
      "Engine ready at height {} with {} deposit(s), {} request(s), {} "
      "validator(s)",
      last_committed_height_, deposits_.records().size(),
      exits_.requests().size(), validators_.validators().size());
}

template <typename Fn>
operation_result_t engine::run_atomic(const std::string_view action, Fn&& fn) {
  auto lock = std::scoped_lock{mutex_};
  auto frame = journal_frame{journal_};
  auto result = operation_result_t{fn()};
  if (result.ok() && frame.outermost()) {
    result = verify_custody();
    if (!result.ok()) {
      spdlog::error("{} broke custody invariants: {}", action, result.info);
    }
  }
  if (!result.ok()) {
    frame.reject();
    spdlog::warn("{} rejected: [{}] {} {}", action, result.codespace, result.log,
                 result.info);
    return result;
  }
  frame.accept();
  spdlog::info("{} accepted", action);
  return result;
}

operation_result_t engine::create(const address_t& caller,
                                  const address_t& withdrawal_address,
                                  const amount_t& payment) {
  return run_atomic("create", [&]() {
    return deposits_.create(caller, withdrawal_address, payment);
  });
}

operation_result_t engine::assign(const address_t& caller,
                                  const record_id_t id,
                                  const bytes_view_t& pubkey,
                                  const bytes_view_t& signature) {
  return run_atomic("assign", [&]() {
    return deposits_.assign(caller, id, pubkey, signature);
  });
}

operation_result_t engine::confirm(const address_t& caller,
                                   const record_id_t id,
                                   const hash32_t& deposit_data_root) {
  return run_atomic("confirm", [&]() {
    return deposits_.confirm(caller, id, deposit_data_root);
  });
}

operation_result_t engine::finalize(const address_t& caller,
                                    const record_id_t id) {
  return run_atomic("finalize",
                    [&]() { return deposits_.finalize(caller, id); });
}

operation_result_t engine::cancel(const address_t& caller,
                                  const record_id_t id) {
  return run_atomic("cancel", [&]() { return deposits_.cancel(caller, id); });
}

operation_result_t engine::transfer_handle(const address_t& caller,
                                           const record_id_t id,
                                           const address_t& to) {
  return run_atomic("transfer_handle", [&]() {
    return deposits_.transfer_handle(caller, id, to);
  });
}

operation_result_t engine::request_deposit(const address_t& caller,
                                           const address_t& controller,
                                           const amount_t& payment) {
  return run_atomic("request_deposit", [&]() {
    return exits_.request_deposit(caller, controller, payment);
  });
}

operation_result_t engine::process_validator_deposit(
    const address_t& caller,
    const request_id_t id,
    const bytes_view_t& pubkey,
    const bytes_view_t& signature,
    const hash32_t& deposit_data_root) {
  return run_atomic("process_validator_deposit", [&]() {
    return exits_.process_validator_deposit(caller, id, pubkey, signature,
                                            deposit_data_root);
  });
}

operation_result_t engine::claim_deposit(const address_t& caller,
                                         const request_id_t id) {
  return run_atomic("claim_deposit",
                    [&]() { return exits_.claim_deposit(caller, id); });
}

operation_result_t engine::cancel_deposit_request(const address_t& caller,
                                                  const request_id_t id) {
  return run_atomic("cancel_deposit_request", [&]() {
    return exits_.cancel_deposit_request(caller, id);
  });
}

operation_result_t engine::request_redeem(const address_t& caller,
                                          const address_t& controller,
                                          const validator_id_t validator_id) {
  return run_atomic("request_redeem", [&]() {
    return exits_.request_redeem(caller, controller, validator_id);
  });
}

operation_result_t engine::start_redeem(const address_t& caller,
                                        const request_id_t id) {
  return run_atomic("start_redeem",
                    [&]() { return exits_.start_redeem(caller, id); });
}

operation_result_t engine::process_redeem(const address_t& caller,
                                          const request_id_t id,
                                          const epoch_t exit_epoch) {
  return run_atomic("process_redeem", [&]() {
    return exits_.process_redeem(caller, id, exit_epoch);
  });
}

operation_result_t engine::claim_redeem(const address_t& caller,
                                        const request_id_t id) {
  return run_atomic("claim_redeem",
                    [&]() { return exits_.claim_redeem(caller, id); });
}

operation_result_t engine::cancel_redeem(const address_t& caller,
                                         const request_id_t id) {
  return run_atomic("cancel_redeem",
                    [&]() { return exits_.cancel_redeem(caller, id); });
}

operation_result_t engine::set_operator(const address_t& caller,
                                        const address_t& address,
                                        const bool enabled) {
  return run_atomic("set_operator", [&]() {
    auto code = authorization_.set_operator(caller, address, enabled);
    if (code != error_code::ok) {
      return make_error(code, kAdminCodespace, to_hex(address));
    }
    return operation_result_t{};
  });
}

std::optional<deposit_record_t> engine::deposit(const record_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto record = deposits_.find(id)) {
    return *record;
  }
  return std::nullopt;
}

std::optional<exit_request_t> engine::request(const request_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto request = exits_.find(id)) {
    return *request;
  }
  return std::nullopt;
}

std::optional<validator_record_t> engine::validator(
    const validator_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto record = validators_.find(id)) {
    return *record;
  }
  return std::nullopt;
}

std::optional<address_t> engine::handle_owner(const record_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return handles_.owner_of(id);
}

std::vector<deposit_record_t> engine::deposits() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<deposit_record_t>{};
  out.reserve(deposits_.records().size());
  for (const auto& [id, record] : deposits_.records()) {
    out.push_back(record);
  }
  return out;
}

std::vector<exit_request_t> engine::requests() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<exit_request_t>{};
  out.reserve(exits_.requests().size());
  for (const auto& [id, request] : exits_.requests()) {
    out.push_back(request);
  }
  return out;
}

std::vector<validator_record_t> engine::validators() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<validator_record_t>{};
  out.reserve(validators_.validators().size());
  for (const auto& [id, record] : validators_.validators()) {
    out.push_back(record);
  }
  return out;
}

custody_totals_t engine::custody() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.totals();
}

address_t engine::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return authorization_.owner();
}

bool engine::is_operator(const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  return authorization_.is_operator(address);
}

duration_seconds_t engine::cancellation_remaining(const record_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto record = deposits_.find(id);
  if (record == nullptr) {
    return 0;
  }
  return cancellation_.remaining(*record, collaborators_.clock());
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (journal_.depth() != 0) {
    stakeline::common::critical("commit called from inside an entry point");
  }
  auto rows = build_state_rows();
  auto height = last_committed_height_ + 1;
  auto state_root = stakeline::blake3::hash_rows(rows);
  storage_.commit_by_prefix(
      make_bytes_view(std::string_view{key::kStatePrefix}), rows,
      stakeline::storage::committed_state{.height = height,
                                          .state_root = state_root});
  last_committed_height_ = height;
  last_committed_state_root_ = state_root;
  spdlog::info("Committed height {} with {} row(s), state root {}", height,
               rows.size(), to_hex(state_root));

  auto result = commit_result_t{};
  result.committed_height = height;
  result.state_root = state_root;
  result.rows_written = rows.size();
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_committed_height = last_committed_height_;
  result.last_committed_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& key) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(key);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto not_found = [&]() {
    auto error = query_error(query_error_code::not_found, "not found",
                             std::string{path});
    error.key = result.key;
    error.height = result.height;
    return error;
  };
  auto invalid_key = [&]() {
    auto error = query_error(query_error_code::invalid_key, "invalid key",
                             std::string{path});
    error.key = result.key;
    error.height = result.height;
    return error;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(info());
    return result;
  }
  if (path == "/custody") {
    result.value = encoder_.encode(ledger_.totals());
    return result;
  }
  if (path == "/operator") {
    auto address = encoder_.try_decode<address_t>(key);
    if (!address) {
      return invalid_key();
    }
    result.value = encoder_.encode(authorization_.is_operator(*address));
    return result;
  }

  auto id = encoder_.try_decode<uint64_t>(key);
  if (path == "/deposit") {
    if (!id) {
      return invalid_key();
    }
    auto record = deposits_.find(*id);
    if (record == nullptr) {
      return not_found();
    }
    result.value = encoder_.encode(*record);
    return result;
  }
  if (path == "/deposit/cancellable_in") {
    if (!id) {
      return invalid_key();
    }
    auto record = deposits_.find(*id);
    if (record == nullptr) {
      return not_found();
    }
    result.value =
        encoder_.encode(cancellation_.remaining(*record, collaborators_.clock()));
    return result;
  }
  if (path == "/handle") {
    if (!id) {
      return invalid_key();
    }
    auto owner = handles_.owner_of(*id);
    if (!owner) {
      return not_found();
    }
    result.value = encoder_.encode(*owner);
    return result;
  }
  if (path == "/request") {
    if (!id) {
      return invalid_key();
    }
    auto request = exits_.find(*id);
    if (request == nullptr) {
      return not_found();
    }
    result.value = encoder_.encode(*request);
    return result;
  }
  if (path == "/validator") {
    if (!id) {
      return invalid_key();
    }
    auto record = validators_.find(*id);
    if (record == nullptr) {
      return not_found();
    }
    result.value = encoder_.encode(*record);
    return result;
  }

  return query_error(query_error_code::unsupported_path, "unsupported path",
                     std::string{path});
}

operation_result_t engine::verify_custody() const {
  const auto& totals = ledger_.totals();
  auto violation = [](std::string info) {
    return make_error(error_code::custody_invariant_violated,
                      kCustodyCodespace, std::move(info));
  };

  if (!ledger_.balanced()) {
    return violation(fmt::format("pending {} + exited {} != held {}",
                                 to_string(totals.pending),
                                 to_string(totals.exited),
                                 to_string(totals.held)));
  }
  auto reserved = amount_t{deposits_.open_count() +
                           exits_.reserved_deposit_count()};
  if (totals.pending != config_.stake_amount * reserved) {
    return violation(fmt::format("pending {} != stake * {} reserved",
                                 to_string(totals.pending),
                                 to_string(reserved)));
  }
  auto active = amount_t{validators_.active_count()};
  if (totals.committed != config_.stake_amount * active) {
    return violation(fmt::format("committed {} != stake * {} active",
                                 to_string(totals.committed),
                                 to_string(active)));
  }
  auto claimable = exits_.claimable_redeem_total();
  if (totals.exited != claimable) {
    return violation(fmt::format("exited {} != claimable redeems {}",
                                 to_string(totals.exited),
                                 to_string(claimable)));
  }
  return {};
}

std::vector<stakeline::storage::key_value_entry_t> engine::build_state_rows()
    const {
  auto rows = std::map<bytes_t, bytes_t>{};
  for (const auto& [id, record] : deposits_.records()) {
    rows.emplace(key::make_deposit_key(encoder_, id), encoder_.encode(record));
  }
  for (const auto& [id, request] : exits_.requests()) {
    rows.emplace(key::make_request_key(encoder_, id), encoder_.encode(request));
  }
  for (const auto& [id, record] : validators_.validators()) {
    rows.emplace(key::make_validator_key(encoder_, id),
                 encoder_.encode(record));
  }
  for (const auto& [id, holder] : handles_.owners()) {
    rows.emplace(key::make_handle_key(encoder_, id),
                 encoder_.encode(std::tuple{id, holder}));
  }
  for (const auto& address : authorization_.operators()) {
    rows.emplace(key::make_operator_key(encoder_, address),
                 encoder_.encode(address));
  }
  for (const auto& pubkey : validators_.used_pubkeys()) {
    rows.emplace(key::make_pubkey_key(encoder_, pubkey),
                 encoder_.encode(pubkey));
  }
  rows.emplace(key::make_engine_key(kOwnerRow),
               encoder_.encode(authorization_.owner()));
  rows.emplace(key::make_engine_key(kCustodyRow),
               encoder_.encode(ledger_.totals()));
  rows.emplace(key::make_engine_key(kSequencesRow),
               encoder_.encode(sequences_t{deposits_.next_id(), exits_.next_id(),
                                           validators_.next_id()}));

  return {std::make_move_iterator(std::begin(rows)),
          std::make_move_iterator(std::end(rows))};
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto committed = storage_.load_committed_state();
  if (!committed) {
    return;
  }

  auto rows = storage_.list_by_prefix(
      make_bytes_view(std::string_view{key::kStatePrefix}));
  auto recomputed = stakeline::blake3::hash_rows(rows);
  if (recomputed != committed->state_root) {
    stakeline::common::critical(
        "state root mismatch at height {}: committed {} recomputed {}",
        committed->height, to_hex(committed->state_root), to_hex(recomputed));
  }

  auto records = std::map<record_id_t, deposit_record_t>{};
  auto requests = std::map<request_id_t, exit_request_t>{};
  auto validators = std::map<validator_id_t, validator_record_t>{};
  auto handles = std::map<record_id_t, address_t>{};
  auto operators = std::vector<address_t>{};
  auto pubkeys = std::set<bls_pubkey_t>{};
  auto owner = config_.owner;
  auto totals = custody_totals_t{};
  auto sequences = sequences_t{1, 1, 1};

  auto has_prefix = [](const bytes_t& key, const std::string_view prefix) {
    return key.size() >= prefix.size() &&
           std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
  };
  for (const auto& row : rows) {
    if (has_prefix(row.first, key::kDepositKeyPrefix)) {
      auto record = decode_row<deposit_record_t>(encoder_, row);
      records.emplace(record.id, record);
    } else if (has_prefix(row.first, key::kRequestKeyPrefix)) {
      auto request = decode_row<exit_request_t>(encoder_, row);
      requests.emplace(request.id, request);
    } else if (has_prefix(row.first, key::kValidatorKeyPrefix)) {
      auto record = decode_row<validator_record_t>(encoder_, row);
      validators.emplace(record.id, record);
    } else if (has_prefix(row.first, key::kHandleKeyPrefix)) {
      auto [id, holder] =
          decode_row<std::tuple<record_id_t, address_t>>(encoder_, row);
      handles.emplace(id, holder);
    } else if (has_prefix(row.first, key::kOperatorKeyPrefix)) {
      operators.push_back(decode_row<address_t>(encoder_, row));
    } else if (has_prefix(row.first, key::kPubkeyKeyPrefix)) {
      pubkeys.insert(decode_row<bls_pubkey_t>(encoder_, row));
    } else if (row.first == key::make_engine_key(kOwnerRow)) {
      owner = decode_row<address_t>(encoder_, row);
    } else if (row.first == key::make_engine_key(kCustodyRow)) {
      totals = decode_row<custody_totals_t>(encoder_, row);
    } else if (row.first == key::make_engine_key(kSequencesRow)) {
      sequences = decode_row<sequences_t>(encoder_, row);
    } else {
      spdlog::warn("Ignoring unknown state row '{}'",
                   make_string(make_bytes_view(row.first)));
    }
  }

  deposits_.restore(std::move(records), std::get<0>(sequences));
  exits_.restore(std::move(requests), std::get<1>(sequences));
  validators_.restore(std::move(validators), std::move(pubkeys),
                      std::get<2>(sequences));
  handles_.restore(std::move(handles));
  authorization_.restore(owner, operators);
  ledger_.restore(totals);
  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;

  if (auto check = verify_custody(); !check.ok()) {
    stakeline::common::critical("persisted custody is inconsistent: {}",
                                check.info);
  }
}

void engine::seed_from_config() {
  if (is_zero(config_.owner)) {
    stakeline::common::critical("engine owner must not be the zero address");
  }
  auto operators = std::vector<address_t>{};
  for (const auto& address : config_.operators) {
    if (is_zero(address)) {
      stakeline::common::critical("operator must not be the zero address");
    }
    operators.push_back(address);
  }
  authorization_.restore(config_.owner, operators);
}

}  // namespace stakeline::execution
