#pragma once
#include <stakeline/common/critical.hpp>
#include <stakeline/schema/encoding/encoder.hpp>
#include <stakeline/schema/encoding/scale/app_info.hpp>
#include <stakeline/schema/encoding/scale/custody_totals.hpp>
#include <stakeline/schema/encoding/scale/deposit_record.hpp>
#include <stakeline/schema/encoding/scale/deposit_status.hpp>
#include <stakeline/schema/encoding/scale/exit_request.hpp>
#include <stakeline/schema/encoding/scale/request_status.hpp>
#include <stakeline/schema/encoding/scale/validator_record.hpp>
#include <stakeline/schema/encoding/scale/validator_status.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace stakeline::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  stakeline::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, stakeline::schema::bytes_t& out);

  template <typename T>
  T decode(const stakeline::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const stakeline::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
stakeline::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    stakeline::common::critical("failed to encode SCALE object: {}",
                                encoded.error().message());
  }
  return std::move(encoded.value());
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        stakeline::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const stakeline::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    stakeline::common::critical("failed to decode SCALE bytes: {}",
                                decoded.error().message());
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const stakeline::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace stakeline::schema::encoding
