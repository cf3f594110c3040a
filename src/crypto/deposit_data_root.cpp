#include <stakeline/crypto/deposit_data_root.hpp>
#include <stakeline/crypto/sha256.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>
#include <limits>

namespace stakeline::crypto {

namespace {

using stakeline::schema::bytes_view_t;
using stakeline::schema::hash32_t;

constexpr auto kZeroChunk = hash32_t{};

bytes_view_t view(const hash32_t& chunk) {
  return bytes_view_t{chunk.data(), chunk.size()};
}

// Pubkeys span two chunks, the second zero padded.
hash32_t pubkey_root(const bytes_view_t& pubkey) {
  return sha256(pubkey, bytes_view_t{kZeroChunk.data(), 16});
}

hash32_t signature_root(const bytes_view_t& signature) {
  auto first = sha256(signature.first(64));
  auto second = sha256(signature.subspan(64), view(kZeroChunk));
  return sha256(view(first), view(second));
}

// SSZ root of a uint64 is its little-endian encoding in one padded chunk.
hash32_t amount_chunk(const uint64_t amount_gwei) {
  auto encoded = boost::endian::little_uint64_buf_t{amount_gwei};
  auto chunk = hash32_t{};
  std::copy_n(encoded.data(), sizeof(encoded), std::begin(chunk));
  return chunk;
}

}  // namespace

stakeline::schema::error_code check_deposit_lengths(
    const bytes_view_t& pubkey,
    const bytes_view_t& signature) {
  if (pubkey.size() != stakeline::schema::kPubkeySize) {
    return stakeline::schema::error_code::invalid_pubkey_length;
  }
  if (signature.size() != stakeline::schema::kSignatureSize) {
    return stakeline::schema::error_code::invalid_signature_length;
  }
  return stakeline::schema::error_code::ok;
}

std::optional<hash32_t> deposit_data_root(const bytes_view_t& pubkey,
                                          const hash32_t& withdrawal_credentials,
                                          const bytes_view_t& signature,
                                          const uint64_t amount_gwei) {
  if (check_deposit_lengths(pubkey, signature) !=
      stakeline::schema::error_code::ok) {
    return std::nullopt;
  }
  auto left = sha256(view(pubkey_root(pubkey)), view(withdrawal_credentials));
  auto right =
      sha256(view(amount_chunk(amount_gwei)), view(signature_root(signature)));
  return sha256(view(left), view(right));
}

hash32_t make_withdrawal_credentials(
    const stakeline::schema::address_t& address) {
  auto credentials = hash32_t{};
  credentials[0] = kEth1AddressWithdrawalPrefix;
  std::copy(std::begin(address), std::end(address),
            std::begin(credentials) + (credentials.size() - address.size()));
  return credentials;
}

std::optional<uint64_t> to_gwei(const stakeline::schema::amount_t& amount) {
  if (amount % stakeline::schema::kGwei != 0) {
    return std::nullopt;
  }
  auto gwei = stakeline::schema::amount_t{amount / stakeline::schema::kGwei};
  if (gwei > std::numeric_limits<uint64_t>::max()) {
    return std::nullopt;
  }
  return gwei.convert_to<uint64_t>();
}

}  // namespace stakeline::crypto
