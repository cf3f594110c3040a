#include <spdlog/spdlog.h>
#include <stakeline/crypto/deposit_data_root.hpp>
#include <stakeline/execution/codespaces.hpp>
#include <stakeline/execution/deposit_registry.hpp>
#include <stakeline/execution/state_machine.hpp>
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
  spdlog::debug("deposit guard failed: {} ({})", to_string(code), info);
  return make_error(code, kDepositCodespace, std::move(info));
}

operation_result_t fail(const error_code code) {
  return fail(code, std::string{});
}

operation_result_t succeed(const uint64_t id) {
  auto result = operation_result_t{};
  result.data = encoder_t{}.encode(id);
  return result;
}

}  // namespace

deposit_registry::deposit_registry(context ctx) : context_{ctx} {
  context_.handles.set_transfer_guard(
      [this](const record_id_t id) { return check_transfer(id); });
}

operation_result_t deposit_registry::create(const address_t& caller,
                                            const address_t& withdrawal_address,
                                            const amount_t& payment) {
  if (payment != context_.stake_amount) {
    return fail(error_code::invalid_payment_amount,
                fmt::format("expected {} wei, got {}",
                            to_string(context_.stake_amount),
                            to_string(payment)));
  }
  if (is_zero(withdrawal_address)) {
    return fail(error_code::invalid_address, "withdrawal address is zero");
  }

  auto record = deposit_record_t{};
  record.id = next_id_;
  record.status = *next_status(deposit_status_t::none, deposit_action_t::create);
  record.owner = caller;
  record.withdrawal_address = withdrawal_address;
  record.withdrawal_credentials =
      stakeline::crypto::make_withdrawal_credentials(withdrawal_address);
  record.committed_amount = context_.stake_amount;
  record.created_at = context_.collaborators.clock();

  context_.undo.assign(next_id_, next_id_ + 1);
  write(record);
  context_.ledger.credit(payment);
  context_.ledger.reserve(context_.stake_amount);
  context_.handles.issue(record.id, caller);
  return succeed(record.id);
}

operation_result_t deposit_registry::assign(const address_t& caller,
                                            const record_id_t id,
                                            const bytes_view_t& pubkey,
                                            const bytes_view_t& signature) {
  auto existing = find(id);
  if (existing == nullptr) {
    return missing(deposit_action_t::assign);
  }
  if (!may_act(*existing, deposit_action_t::assign, caller)) {
    return fail(error_code::authorization_denied, "caller is not an operator");
  }
  if (auto result = check_status(*existing, deposit_action_t::assign);
      !result.ok()) {
    return result;
  }
  auto lengths = stakeline::crypto::check_deposit_lengths(pubkey, signature);
  if (lengths != error_code::ok) {
    return fail(lengths, fmt::format("pubkey={} signature={}", pubkey.size(),
                                     signature.size()));
  }

  auto record = *existing;
  std::copy(std::begin(pubkey), std::end(pubkey), std::begin(record.pubkey));
  std::copy(std::begin(signature), std::end(signature),
            std::begin(record.signature));
  if (context_.validators.pubkey_in_use(record.pubkey)) {
    return fail(error_code::pubkey_in_use, to_hex(record.pubkey));
  }

  record.status = *next_status(record.status, deposit_action_t::assign);
  record.assigned_operator = caller;
  context_.validators.claim_pubkey(record.pubkey);
  write(record);
  return succeed(id);
}

operation_result_t deposit_registry::confirm(const address_t& caller,
                                             const record_id_t id,
                                             const hash32_t& supplied_root) {
  auto existing = find(id);
  if (existing == nullptr) {
    return missing(deposit_action_t::confirm);
  }
  if (!may_act(*existing, deposit_action_t::confirm, caller)) {
    return fail(error_code::authorization_denied,
                "caller is neither the withdrawal address nor the handle owner");
  }
  if (auto result = check_status(*existing, deposit_action_t::confirm);
      !result.ok()) {
    return result;
  }

  auto computed = stakeline::crypto::deposit_data_root(
      existing->pubkey, existing->withdrawal_credentials, existing->signature,
      context_.stake_gwei);
  if (!computed) {
    return fail(error_code::invalid_pubkey_length);
  }
  if (*computed != supplied_root) {
    return fail(error_code::deposit_data_root_mismatch,
                fmt::format("supplied={} computed={}", to_hex(supplied_root),
                            to_hex(*computed)));
  }

  auto record = *existing;
  record.status = *next_status(record.status, deposit_action_t::confirm);
  record.committed_root = supplied_root;
  record.confirmed_at = context_.collaborators.clock();
  write(record);
  return succeed(id);
}

operation_result_t deposit_registry::finalize(const address_t& caller,
                                              const record_id_t id) {
  auto existing = find(id);
  if (existing == nullptr) {
    return missing(deposit_action_t::finalize);
  }
  if (!may_act(*existing, deposit_action_t::finalize, caller)) {
    return fail(error_code::authorization_denied, "caller is not an operator");
  }
  if (auto result = check_status(*existing, deposit_action_t::finalize);
      !result.ok()) {
    return result;
  }

  auto owner = context_.handles.owner_of(id).value_or(existing->owner);
  auto record = *existing;
  record.status = *next_status(record.status, deposit_action_t::finalize);
  record.validator_id = context_.validators.add(
      record.pubkey, record.withdrawal_credentials, owner,
      validator_source_t::deposit_record, record.id);
  write(record);
  if (auto code = context_.ledger.release(record.committed_amount);
      code != error_code::ok) {
    return fail(code, "release");
  }
  if (auto code = context_.ledger.debit(record.committed_amount);
      code != error_code::ok) {
    return fail(code, "debit");
  }

  auto call = deposit_call_t{};
  call.pubkey = record.pubkey;
  call.withdrawal_credentials = record.withdrawal_credentials;
  call.signature = record.signature;
  call.deposit_data_root = record.committed_root;
  call.amount = record.committed_amount;
  if (!call_collaborator("deposit sink", context_.collaborators.deposit_sink,
                         call)) {
    return fail(error_code::deposit_sink_failed,
                fmt::format("record {}", record.id));
  }
  return succeed(record.validator_id);
}

operation_result_t deposit_registry::cancel(const address_t& caller,
                                            const record_id_t id) {
  auto existing = find(id);
  if (existing == nullptr) {
    return missing(deposit_action_t::cancel);
  }
  if (!may_act(*existing, deposit_action_t::cancel, caller)) {
    return fail(error_code::authorization_denied,
                "caller is neither the withdrawal address nor the handle owner");
  }
  if (auto result = context_.cancellation.evaluate(
          *existing, context_.collaborators.clock());
      !result.ok()) {
    spdlog::debug("cancel of record {} blocked: {}", id, result.info);
    return result;
  }

  auto record = *existing;
  auto recipient = context_.handles.owner_of(id).value_or(record.owner);
  if (record.status != deposit_status_t::requested) {
    context_.validators.release_pubkey(record.pubkey);
  }
  context_.undo.erase(records_, id);
  context_.handles.burn(id);
  if (auto code = context_.ledger.refund(record.committed_amount);
      code != error_code::ok) {
    return fail(code, "refund");
  }
  if (auto code = context_.ledger.debit(record.committed_amount);
      code != error_code::ok) {
    return fail(code, "debit");
  }
  if (!call_collaborator("value transfer",
                         context_.collaborators.value_transfer, recipient,
                         record.committed_amount)) {
    return fail(error_code::value_transfer_failed,
                fmt::format("refund of record {} to {}", id, to_hex(recipient)));
  }
  return succeed(id);
}

operation_result_t deposit_registry::transfer_handle(const address_t& caller,
                                                     const record_id_t id,
                                                     const address_t& to) {
  auto existing = find(id);
  if (existing == nullptr) {
    return make_error(error_code::state_violation, kDepositCodespace,
                      "transfer_handle requires finalized; actual none");
  }
  auto code = context_.handles.transfer(caller, id, to);
  if (code != error_code::ok) {
    return fail(code, fmt::format("record {} status {}", id,
                                  to_string(existing->status)));
  }
  context_.validators.set_owner(existing->validator_id, to);
  return succeed(id);
}

const deposit_record_t* deposit_registry::find(const record_id_t id) const {
  auto it = records_.find(id);
  if (it == std::end(records_)) {
    return nullptr;
  }
  return &it->second;
}

std::size_t deposit_registry::open_count() const {
  return static_cast<std::size_t>(
      std::count_if(std::begin(records_), std::end(records_),
                    [](const auto& entry) { return is_open(entry.second.status); }));
}

void deposit_registry::restore(std::map<record_id_t, deposit_record_t> records,
                               const record_id_t next_id) {
  records_ = std::move(records);
  next_id_ = next_id;
}

operation_result_t deposit_registry::missing(
    const deposit_action_t action) const {
  return fail(error_code::state_violation,
              describe_state_violation(action, deposit_status_t::none));
}

operation_result_t deposit_registry::check_status(
    const deposit_record_t& record,
    const deposit_action_t action) const {
  if (!next_status(record.status, action)) {
    return fail(error_code::state_violation,
                describe_state_violation(action, record.status));
  }
  return {};
}

bool deposit_registry::may_act(const deposit_record_t& record,
                               const deposit_action_t action,
                               const address_t& caller) const {
  switch (required_actor(action)) {
    case deposit_actor_t::depositor:
      return true;
    case deposit_actor_t::operator_set:
      return context_.authorization.is_operator(caller);
    case deposit_actor_t::credential_holder_or_handle_owner:
      return caller == record.withdrawal_address ||
             context_.handles.is_owner(record.id, caller);
  }
  return false;
}

error_code deposit_registry::check_transfer(const record_id_t id) const {
  auto record = find(id);
  if (record == nullptr ||
      record->status != deposit_status_t::finalized) {
    return error_code::handle_transfer_locked;
  }
  // A validator held by a redeem request, or already exited, pins the handle.
  auto validator = context_.validators.find(record->validator_id);
  if (validator == nullptr || validator->locked_by != 0 ||
      validator->status != validator_status_t::active) {
    return error_code::handle_transfer_locked;
  }
  return error_code::ok;
}

void deposit_registry::write(const deposit_record_t& record) {
  context_.undo.put(records_, record.id, record);
}

}  // namespace stakeline::execution
