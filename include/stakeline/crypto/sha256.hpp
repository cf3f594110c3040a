#pragma once

#include <stakeline/schema/primitives.hpp>

namespace stakeline::crypto {

stakeline::schema::hash32_t sha256(const stakeline::schema::bytes_view_t& bytes);

/// SHA-256 of `left || right` without materializing the concatenation.
stakeline::schema::hash32_t sha256(const stakeline::schema::bytes_view_t& left,
                                   const stakeline::schema::bytes_view_t& right);

}  // namespace stakeline::crypto
