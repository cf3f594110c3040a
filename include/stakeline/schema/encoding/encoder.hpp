#pragma once
#include <stakeline/schema/primitives.hpp>
#include <optional>
#include <span>

namespace stakeline::schema::encoding {

// Encoding backend is a build-time choice selected by tag type; rows,
// storage keys and query payloads all go through this interface.
template <typename Library>
struct encoder {
  template <typename T>
  stakeline::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, stakeline::schema::bytes_t& out);

  template <typename T>
  T decode(const stakeline::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const stakeline::schema::bytes_view_t& bytes);
};

}  // namespace stakeline::schema::encoding
