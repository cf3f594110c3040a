#include <spdlog/spdlog.h>
#include <stakeline/crypto/deposit_data_root.hpp>
#include <stakeline/execution/codespaces.hpp>
#include <stakeline/execution/exit_tracker.hpp>
#include <stakeline/schema/encoding/scale/encoder.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace stakeline::schema;

namespace stakeline::execution {

namespace {

using encoder_t = stakeline::schema::encoding::scale_encoder_t;

operation_result_t fail(const error_code code, std::string info) {
  spdlog::debug("exit guard failed: {} ({})", to_string(code), info);
  return make_error(code, kExitCodespace, std::move(info));
}

operation_result_t wrong_status(const std::string_view action,
                                const std::string_view required,
                                const request_status_t actual) {
  if (actual == request_status_t::claimed && required == "claimable") {
    return fail(error_code::already_claimed, std::string{action});
  }
  return fail(error_code::state_violation,
              fmt::format("{} requires {}; actual {}", action, required,
                          to_string(actual)));
}

operation_result_t succeed(const uint64_t id) {
  auto result = operation_result_t{};
  result.data = encoder_t{}.encode(id);
  return result;
}

}  // namespace

exit_tracker::exit_tracker(context ctx) : context_{ctx} {}

operation_result_t exit_tracker::request_deposit(const address_t& caller,
                                                 const address_t& controller,
                                                 const amount_t& payment) {
  if (payment != context_.stake_amount) {
    return fail(error_code::invalid_payment_amount,
                fmt::format("expected {} wei, got {}",
                            to_string(context_.stake_amount),
                            to_string(payment)));
  }
  if (is_zero(controller)) {
    return fail(error_code::invalid_address, "controller is zero");
  }

  auto request = exit_request_t{};
  request.id = allocate_id();
  request.kind = request_kind_t::deposit;
  request.status = request_status_t::pending;
  request.amount = context_.stake_amount;
  request.owner = caller;
  request.controller = controller;
  request.created_at = context_.collaborators.clock();
  write(request);
  context_.ledger.credit(payment);
  context_.ledger.reserve(request.amount);
  return succeed(request.id);
}

operation_result_t exit_tracker::process_validator_deposit(
    const address_t& caller,
    const request_id_t id,
    const bytes_view_t& pubkey,
    const bytes_view_t& signature,
    const hash32_t& supplied_root) {
  auto failure = operation_result_t{};
  auto existing =
      lookup(id, request_kind_t::deposit, "process_validator_deposit", failure);
  if (existing == nullptr) {
    return failure;
  }
  if (!context_.authorization.is_operator(caller)) {
    return fail(error_code::authorization_denied, "caller is not a keeper");
  }
  if (existing->status != request_status_t::pending) {
    return wrong_status("process_validator_deposit", "pending",
                        existing->status);
  }
  if (is_zero(context_.vault_withdrawal_address)) {
    return fail(error_code::invalid_address,
                "vault withdrawal address is zero");
  }
  auto lengths = stakeline::crypto::check_deposit_lengths(pubkey, signature);
  if (lengths != error_code::ok) {
    return fail(lengths, fmt::format("pubkey={} signature={}", pubkey.size(),
                                     signature.size()));
  }

  auto request = *existing;
  std::copy(std::begin(pubkey), std::end(pubkey), std::begin(request.pubkey));
  std::copy(std::begin(signature), std::end(signature),
            std::begin(request.signature));
  if (context_.validators.pubkey_in_use(request.pubkey)) {
    return fail(error_code::pubkey_in_use, to_hex(request.pubkey));
  }
  auto computed = stakeline::crypto::deposit_data_root(
      request.pubkey, context_.vault_withdrawal_credentials, request.signature,
      context_.stake_gwei);
  if (!computed || *computed != supplied_root) {
    return fail(error_code::deposit_data_root_mismatch,
                fmt::format("supplied={}", to_hex(supplied_root)));
  }

  request.status = request_status_t::processing;
  request.committed_root = supplied_root;
  request.validator_id = context_.validators.add(
      request.pubkey, context_.vault_withdrawal_credentials, request.controller,
      validator_source_t::vault_request, request.id);
  write(request);
  if (auto code = context_.ledger.release(request.amount);
      code != error_code::ok) {
    return fail(code, "release");
  }
  if (auto code = context_.ledger.debit(request.amount);
      code != error_code::ok) {
    return fail(code, "debit");
  }

  auto call = deposit_call_t{};
  call.pubkey = request.pubkey;
  call.withdrawal_credentials = context_.vault_withdrawal_credentials;
  call.signature = request.signature;
  call.deposit_data_root = request.committed_root;
  call.amount = request.amount;
  if (!call_collaborator("deposit sink", context_.collaborators.deposit_sink,
                         call)) {
    return fail(error_code::deposit_sink_failed,
                fmt::format("request {}", request.id));
  }

  request.status = request_status_t::claimable;
  write(request);
  return succeed(request.validator_id);
}

operation_result_t exit_tracker::claim_deposit(const address_t& caller,
                                               const request_id_t id) {
  auto failure = operation_result_t{};
  auto existing = lookup(id, request_kind_t::deposit, "claim_deposit", failure);
  if (existing == nullptr) {
    return failure;
  }
  if (!is_party(*existing, caller)) {
    return fail(error_code::authorization_denied,
                "caller is neither owner nor controller");
  }
  if (existing->status != request_status_t::claimable) {
    return wrong_status("claim_deposit", "claimable", existing->status);
  }
  auto request = *existing;
  request.status = request_status_t::claimed;
  write(request);
  return succeed(request.validator_id);
}

operation_result_t exit_tracker::cancel_deposit_request(const address_t& caller,
                                                        const request_id_t id) {
  auto failure = operation_result_t{};
  auto existing =
      lookup(id, request_kind_t::deposit, "cancel_deposit_request", failure);
  if (existing == nullptr) {
    return failure;
  }
  if (!is_party(*existing, caller)) {
    return fail(error_code::authorization_denied,
                "caller is neither owner nor controller");
  }
  if (existing->status != request_status_t::pending) {
    return wrong_status("cancel_deposit_request", "pending", existing->status);
  }

  auto request = *existing;
  request.status = request_status_t::cancelled;
  write(request);
  if (auto code = context_.ledger.refund(request.amount);
      code != error_code::ok) {
    return fail(code, "refund");
  }
  if (auto code = context_.ledger.debit(request.amount);
      code != error_code::ok) {
    return fail(code, "debit");
  }
  if (!call_collaborator("value transfer",
                         context_.collaborators.value_transfer, request.owner,
                         request.amount)) {
    return fail(error_code::value_transfer_failed,
                fmt::format("refund of request {}", request.id));
  }
  return succeed(request.id);
}

operation_result_t exit_tracker::request_redeem(const address_t& caller,
                                                const address_t& controller,
                                                const validator_id_t validator_id) {
  auto validator = context_.validators.find(validator_id);
  if (validator == nullptr) {
    return fail(error_code::validator_unavailable,
                fmt::format("validator {} not found", validator_id));
  }
  if (validator->owner != caller) {
    return fail(error_code::authorization_denied,
                "caller does not own the validator");
  }
  if (validator->status != validator_status_t::active ||
      validator->locked_by != 0) {
    return fail(error_code::validator_unavailable,
                fmt::format("validator {} is {} locked_by={}", validator_id,
                            to_string(validator->status), validator->locked_by));
  }
  if (is_zero(controller)) {
    return fail(error_code::invalid_address, "controller is zero");
  }

  auto request = exit_request_t{};
  request.id = allocate_id();
  request.kind = request_kind_t::redeem;
  request.status = request_status_t::pending;
  request.amount = context_.stake_amount;
  request.owner = caller;
  request.controller = controller;
  request.validator_id = validator_id;
  request.pubkey = validator->pubkey;
  request.created_at = context_.collaborators.clock();
  write(request);
  context_.validators.lock(validator_id, request.id);
  return succeed(request.id);
}

operation_result_t exit_tracker::start_redeem(const address_t& caller,
                                              const request_id_t id) {
  auto failure = operation_result_t{};
  auto existing = lookup(id, request_kind_t::redeem, "start_redeem", failure);
  if (existing == nullptr) {
    return failure;
  }
  if (!context_.authorization.is_operator(caller)) {
    return fail(error_code::authorization_denied, "caller is not a keeper");
  }
  if (existing->status != request_status_t::pending) {
    return wrong_status("start_redeem", "pending", existing->status);
  }
  auto request = *existing;
  request.status = request_status_t::processing;
  write(request);
  return succeed(request.id);
}

operation_result_t exit_tracker::process_redeem(const address_t& caller,
                                                const request_id_t id,
                                                const epoch_t exit_epoch) {
  auto failure = operation_result_t{};
  auto existing = lookup(id, request_kind_t::redeem, "process_redeem", failure);
  if (existing == nullptr) {
    return failure;
  }
  if (!context_.authorization.is_operator(caller)) {
    return fail(error_code::authorization_denied, "caller is not a keeper");
  }
  if (existing->status != request_status_t::pending &&
      existing->status != request_status_t::processing) {
    return wrong_status("process_redeem", "pending|processing",
                        existing->status);
  }

  auto request = *existing;
  request.status = request_status_t::claimable;
  request.exit_epoch = exit_epoch;
  write(request);
  context_.validators.mark_exited(request.validator_id, exit_epoch);
  context_.ledger.credit(request.amount);
  if (auto code = context_.ledger.retire(request.amount);
      code != error_code::ok) {
    return fail(code, "retire");
  }
  return succeed(request.id);
}

operation_result_t exit_tracker::claim_redeem(const address_t& caller,
                                              const request_id_t id) {
  auto failure = operation_result_t{};
  auto existing = lookup(id, request_kind_t::redeem, "claim_redeem", failure);
  if (existing == nullptr) {
    return failure;
  }
  if (!is_party(*existing, caller)) {
    return fail(error_code::authorization_denied,
                "caller is neither owner nor controller");
  }
  if (existing->status != request_status_t::claimable) {
    return wrong_status("claim_redeem", "claimable", existing->status);
  }

  auto request = *existing;
  request.status = request_status_t::claimed;
  write(request);
  if (auto code = context_.ledger.pay_out(request.amount);
      code != error_code::ok) {
    return fail(code, "pay_out");
  }
  if (auto code = context_.ledger.debit(request.amount);
      code != error_code::ok) {
    return fail(code, "debit");
  }
  if (!call_collaborator("value transfer",
                         context_.collaborators.value_transfer, request.owner,
                         request.amount)) {
    return fail(error_code::value_transfer_failed,
                fmt::format("payout of request {}", request.id));
  }
  return succeed(request.id);
}

operation_result_t exit_tracker::cancel_redeem(const address_t& caller,
                                               const request_id_t id) {
  auto failure = operation_result_t{};
  auto existing = lookup(id, request_kind_t::redeem, "cancel_redeem", failure);
  if (existing == nullptr) {
    return failure;
  }
  if (!is_party(*existing, caller)) {
    return fail(error_code::authorization_denied,
                "caller is neither owner nor controller");
  }
  if (existing->status != request_status_t::pending) {
    return wrong_status("cancel_redeem", "pending", existing->status);
  }
  auto request = *existing;
  request.status = request_status_t::cancelled;
  write(request);
  context_.validators.unlock(request.validator_id);
  return succeed(request.id);
}

const exit_request_t* exit_tracker::find(const request_id_t id) const {
  auto it = requests_.find(id);
  if (it == std::end(requests_)) {
    return nullptr;
  }
  return &it->second;
}

std::size_t exit_tracker::reserved_deposit_count() const {
  return static_cast<std::size_t>(std::count_if(
      std::begin(requests_), std::end(requests_), [](const auto& entry) {
        const auto& request = entry.second;
        return request.kind == request_kind_t::deposit &&
               (request.status == request_status_t::pending ||
                request.status == request_status_t::processing);
      }));
}

amount_t exit_tracker::claimable_redeem_total() const {
  auto total = amount_t{};
  for (const auto& [id, request] : requests_) {
    if (request.kind == request_kind_t::redeem &&
        request.status == request_status_t::claimable) {
      total += request.amount;
    }
  }
  return total;
}

void exit_tracker::restore(std::map<request_id_t, exit_request_t> requests,
                           const request_id_t next_id) {
  requests_ = std::move(requests);
  next_id_ = next_id;
}

const exit_request_t* exit_tracker::lookup(const request_id_t id,
                                           const request_kind_t kind,
                                           const std::string_view action,
                                           operation_result_t& failure) const {
  auto request = find(id);
  if (request == nullptr) {
    failure = fail(error_code::state_violation,
                   fmt::format("{}: request {} not found; actual none", action,
                               id));
    return nullptr;
  }
  if (request->kind != kind) {
    failure = fail(error_code::invalid_request_kind,
                   fmt::format("{} expects a {} request; got {}", action,
                               to_string(kind), to_string(request->kind)));
    return nullptr;
  }
  return request;
}

bool exit_tracker::is_party(const exit_request_t& request,
                            const address_t& caller) const {
  return caller == request.owner || caller == request.controller;
}

request_id_t exit_tracker::allocate_id() {
  auto id = next_id_;
  context_.undo.assign(next_id_, next_id_ + 1);
  return id;
}

void exit_tracker::write(const exit_request_t& request) {
  context_.undo.put(requests_, request.id, request);
}

}  // namespace stakeline::execution
