#pragma once

#include <stakeline/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit result.
// Height and state_root of the checkpoint written by engine::commit.
namespace stakeline::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root;
  uint64_t rows_written{};
};

using commit_result_t = commit_result<1>;

}  // namespace stakeline::schema
