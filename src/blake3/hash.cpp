#include <blake3.h>
#include <boost/endian/buffers.hpp>
#include <stakeline/blake3/hash.hpp>

namespace stakeline::blake3 {

namespace {

void update_length_prefixed(blake3_hasher& hasher,
                            const stakeline::schema::bytes_t& bytes) {
  auto length = boost::endian::little_uint64_buf_t{bytes.size()};
  blake3_hasher_update(&hasher, length.data(), sizeof(length));
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
}

}  // namespace

stakeline::schema::hash32_t hash_rows(
    const std::vector<
        std::pair<stakeline::schema::bytes_t, stakeline::schema::bytes_t>>&
        rows) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& [key, value] : rows) {
    update_length_prefixed(hasher, key);
    update_length_prefixed(hasher, value);
  }
  auto output = stakeline::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace stakeline::blake3
