#pragma once
#include <stakeline/schema/primitives.hpp>
#include <stakeline/schema/request_status.hpp>

namespace stakeline::schema {

template <uint16_t Version>
struct exit_request;

/// Async vault request, for either capital direction.
///
/// Deposit requests carry the validator credentials once processed; redeem
/// requests reference an existing validator from creation onwards.
template <>
struct exit_request<1> final {
  uint16_t version{1};
  request_id_t id{};
  request_kind_t kind{request_kind_t::deposit};
  request_status_t status{request_status_t::pending};
  amount_t amount{};
  address_t owner{};
  address_t controller{};
  validator_id_t validator_id{};
  bls_pubkey_t pubkey{};
  bls_signature_t signature{};
  hash32_t committed_root{};
  epoch_t exit_epoch{};
  timestamp_seconds_t created_at{};
};

using exit_request_t = exit_request<1>;

}  // namespace stakeline::schema
