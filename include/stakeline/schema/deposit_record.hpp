#pragma once
#include <stakeline/schema/deposit_status.hpp>
#include <stakeline/schema/primitives.hpp>

namespace stakeline::schema {

template <uint16_t Version>
struct deposit_record;

/// One validator deposit moving through the registry lifecycle.
///
/// `pubkey` and `signature` are zero until the record is assigned and never
/// change afterwards. `committed_root` and `confirmed_at` are set by confirm;
/// `validator_id` by finalize.
template <>
struct deposit_record<1> final {
  uint16_t version{1};
  record_id_t id{};
  deposit_status_t status{deposit_status_t::none};
  address_t owner{};
  address_t withdrawal_address{};
  hash32_t withdrawal_credentials{};
  bls_pubkey_t pubkey{};
  bls_signature_t signature{};
  hash32_t committed_root{};
  address_t assigned_operator{};
  amount_t committed_amount{};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t confirmed_at{};
  validator_id_t validator_id{};
};

using deposit_record_t = deposit_record<1>;

}  // namespace stakeline::schema
