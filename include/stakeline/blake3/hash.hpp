#pragma once
#include <stakeline/schema/primitives.hpp>
#include <utility>
#include <vector>

namespace stakeline::blake3 {

/// Digest of a sequence of rows, each fed as length-prefixed key then value,
/// so that row boundaries are part of the digest.
stakeline::schema::hash32_t hash_rows(
    const std::vector<
        std::pair<stakeline::schema::bytes_t, stakeline::schema::bytes_t>>&
        rows);

}  // namespace stakeline::blake3
