#pragma once

#include <stakeline/schema/primitives.hpp>

#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Raw key prefixes for committed state rows. Every row lives under
// kStatePrefix so a commit can replace the whole keyspace atomically.
namespace stakeline::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kDepositKeyPrefix{"SYS|STATE|DEPOSIT|"};
inline constexpr std::string_view kRequestKeyPrefix{"SYS|STATE|REQUEST|"};
inline constexpr std::string_view kValidatorKeyPrefix{"SYS|STATE|VALIDATOR|"};
inline constexpr std::string_view kHandleKeyPrefix{"SYS|STATE|HANDLE|"};
inline constexpr std::string_view kOperatorKeyPrefix{"SYS|STATE|OPERATOR|"};
inline constexpr std::string_view kPubkeyKeyPrefix{"SYS|STATE|PUBKEY|"};
inline constexpr std::string_view kEngineKeyPrefix{"SYS|STATE|ENGINE|"};

inline stakeline::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return stakeline::schema::make_bytes(prefix);
}

template <typename Encoder, typename T>
stakeline::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  auto key = make_prefix_key(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
stakeline::schema::bytes_t make_deposit_key(Encoder& encoder,
                                            stakeline::schema::record_id_t id) {
  return make_prefixed_key(encoder, kDepositKeyPrefix, id);
}

template <typename Encoder>
stakeline::schema::bytes_t make_request_key(
    Encoder& encoder,
    stakeline::schema::request_id_t id) {
  return make_prefixed_key(encoder, kRequestKeyPrefix, id);
}

template <typename Encoder>
stakeline::schema::bytes_t make_validator_key(
    Encoder& encoder,
    stakeline::schema::validator_id_t id) {
  return make_prefixed_key(encoder, kValidatorKeyPrefix, id);
}

template <typename Encoder>
stakeline::schema::bytes_t make_handle_key(Encoder& encoder,
                                           stakeline::schema::record_id_t id) {
  return make_prefixed_key(encoder, kHandleKeyPrefix, id);
}

template <typename Encoder>
stakeline::schema::bytes_t make_operator_key(
    Encoder& encoder,
    const stakeline::schema::address_t& address) {
  return make_prefixed_key(encoder, kOperatorKeyPrefix, address);
}

template <typename Encoder>
stakeline::schema::bytes_t make_pubkey_key(
    Encoder& encoder,
    const stakeline::schema::bls_pubkey_t& pubkey) {
  return make_prefixed_key(encoder, kPubkeyKeyPrefix, pubkey);
}

inline stakeline::schema::bytes_t make_engine_key(std::string_view name) {
  auto key = make_prefix_key(kEngineKeyPrefix);
  key.insert(std::end(key), std::begin(name), std::end(name));
  return key;
}

}  // namespace stakeline::schema::key
