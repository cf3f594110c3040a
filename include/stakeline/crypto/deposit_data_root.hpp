#pragma once

#include <stakeline/schema/error_code.hpp>
#include <stakeline/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace stakeline::crypto {

/// Prefix byte of execution-address withdrawal credentials.
inline constexpr auto kEth1AddressWithdrawalPrefix = uint8_t{0x01};

/// `invalid_pubkey_length`, `invalid_signature_length` or `ok`.
stakeline::schema::error_code check_deposit_lengths(
    const stakeline::schema::bytes_view_t& pubkey,
    const stakeline::schema::bytes_view_t& signature);

/// Recompute the beacon deposit contract's `deposit_data_root`.
///
/// Builds the SSZ hash-tree-root of DepositData{pubkey, withdrawal
/// credentials, amount, signature} with SHA-256, where `amount_gwei` is the
/// stake in the deposit sub-unit. Returns std::nullopt when the pubkey is
/// not 48 bytes or the signature is not 96 bytes.
std::optional<stakeline::schema::hash32_t> deposit_data_root(
    const stakeline::schema::bytes_view_t& pubkey,
    const stakeline::schema::hash32_t& withdrawal_credentials,
    const stakeline::schema::bytes_view_t& signature,
    uint64_t amount_gwei);

/// 0x01 || 11 zero bytes || address.
stakeline::schema::hash32_t make_withdrawal_credentials(
    const stakeline::schema::address_t& address);

/// Wei to gwei; std::nullopt unless the amount is a whole number of gwei that
/// fits in 64 bits.
std::optional<uint64_t> to_gwei(const stakeline::schema::amount_t& amount);

}  // namespace stakeline::crypto
