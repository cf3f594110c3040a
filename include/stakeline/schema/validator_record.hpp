#pragma once
#include <stakeline/schema/primitives.hpp>
#include <stakeline/schema/validator_status.hpp>

namespace stakeline::schema {

template <uint16_t Version>
struct validator_record;

template <>
struct validator_record<1> final {
  uint16_t version{1};
  validator_id_t id{};
  bls_pubkey_t pubkey{};
  hash32_t withdrawal_credentials{};
  address_t owner{};
  validator_source_t source{validator_source_t::deposit_record};
  uint64_t source_id{};
  validator_status_t status{validator_status_t::active};
  epoch_t exit_epoch{};
  // Redeem request holding the validator, 0 when unlocked.
  request_id_t locked_by{};
};

using validator_record_t = validator_record<1>;

}  // namespace stakeline::schema
