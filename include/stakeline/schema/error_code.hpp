#pragma once

#include <cstdint>
#include <string_view>

namespace stakeline::schema {

enum class error_code : uint32_t {
  ok = 0,
  invalid_payment_amount = 1,
  invalid_pubkey_length = 2,
  invalid_signature_length = 3,
  invalid_address = 4,
  pubkey_in_use = 5,
  invalid_request_kind = 6,
  state_violation = 10,
  cooldown_active = 11,
  already_claimed = 12,
  handle_transfer_locked = 13,
  validator_unavailable = 14,
  authorization_denied = 20,
  deposit_data_root_mismatch = 30,
  deposit_sink_failed = 40,
  value_transfer_failed = 41,
  custody_underflow = 50,
  custody_invariant_violated = 51,
};

enum class error_category_t : uint8_t {
  none,
  validation,
  state_violation,
  authorization,
  authenticity,
  external_call,
  custody
};

constexpr error_category_t category(const error_code code) {
  switch (code) {
    case error_code::ok:
      return error_category_t::none;
    case error_code::invalid_payment_amount:
    case error_code::invalid_pubkey_length:
    case error_code::invalid_signature_length:
    case error_code::invalid_address:
    case error_code::pubkey_in_use:
    case error_code::invalid_request_kind:
      return error_category_t::validation;
    case error_code::state_violation:
    case error_code::cooldown_active:
    case error_code::already_claimed:
    case error_code::handle_transfer_locked:
    case error_code::validator_unavailable:
      return error_category_t::state_violation;
    case error_code::authorization_denied:
      return error_category_t::authorization;
    case error_code::deposit_data_root_mismatch:
      return error_category_t::authenticity;
    case error_code::deposit_sink_failed:
    case error_code::value_transfer_failed:
      return error_category_t::external_call;
    case error_code::custody_underflow:
    case error_code::custody_invariant_violated:
      return error_category_t::custody;
  }
  return error_category_t::custody;
}

/// Failures a keeper may retry later without changing its input.
constexpr bool is_transient(const error_code code) {
  return code == error_code::cooldown_active ||
         code == error_code::state_violation;
}

constexpr std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::ok:
      return "ok";
    case error_code::invalid_payment_amount:
      return "invalid payment amount";
    case error_code::invalid_pubkey_length:
      return "invalid pubkey length";
    case error_code::invalid_signature_length:
      return "invalid signature length";
    case error_code::invalid_address:
      return "invalid address";
    case error_code::pubkey_in_use:
      return "pubkey already in use";
    case error_code::invalid_request_kind:
      return "invalid request kind";
    case error_code::state_violation:
      return "state violation";
    case error_code::cooldown_active:
      return "cancellation cooldown active";
    case error_code::already_claimed:
      return "already claimed";
    case error_code::handle_transfer_locked:
      return "handle transfer locked";
    case error_code::validator_unavailable:
      return "validator unavailable";
    case error_code::authorization_denied:
      return "authorization denied";
    case error_code::deposit_data_root_mismatch:
      return "deposit data root mismatch";
    case error_code::deposit_sink_failed:
      return "deposit sink call failed";
    case error_code::value_transfer_failed:
      return "value transfer failed";
    case error_code::custody_underflow:
      return "custody underflow";
    case error_code::custody_invariant_violated:
      return "custody invariant violated";
  }
  return "unknown";
}

}  // namespace stakeline::schema
