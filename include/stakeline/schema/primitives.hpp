#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stakeline::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;
using epoch_t = uint64_t;

/// Integer ids shared by deposit records, vault requests and validators.
using record_id_t = uint64_t;
using request_id_t = uint64_t;
using validator_id_t = uint64_t;

inline constexpr auto kPubkeySize = std::size_t{48};
inline constexpr auto kSignatureSize = std::size_t{96};

using bls_pubkey_t = std::array<uint8_t, kPubkeySize>;
using bls_signature_t = std::array<uint8_t, kSignatureSize>;

/// 1 gwei in wei; the deposit contract accounts in gwei.
inline const auto kGwei = amount_t{1'000'000'000ull};
/// Fixed stake unit: 32 ETH expressed in wei.
inline const auto kStakeAmount = amount_t{32} * kGwei * kGwei;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

std::optional<address_t> try_make_address(const std::string_view& hex);
bool is_zero(const address_t& address);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::string to_string(const amount_t& amount);

}  // namespace stakeline::schema
