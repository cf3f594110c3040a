#pragma once

#include <stakeline/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace stakeline::testing {

template <typename Array>
Array make_sequence(const uint8_t seed) {
  auto out = Array{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline stakeline::schema::hash32_t make_hash(const uint8_t seed) {
  return make_sequence<stakeline::schema::hash32_t>(seed);
}

/// Non-zero address whose bytes count up from `seed`.
inline stakeline::schema::address_t make_address(const uint8_t seed) {
  return make_sequence<stakeline::schema::address_t>(seed);
}

inline stakeline::schema::bls_pubkey_t make_pubkey(const uint8_t seed) {
  return make_sequence<stakeline::schema::bls_pubkey_t>(seed);
}

inline stakeline::schema::bls_signature_t make_signature(const uint8_t seed) {
  return make_sequence<stakeline::schema::bls_signature_t>(seed);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace stakeline::testing
