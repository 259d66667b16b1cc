#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace regen::util {

// Must succeed before any digest is taken; safe to call repeatedly.
Result init_hashing();

std::string sha256_hex(std::string_view payload);

// Opaque evidence references: lowercase/uppercase hex or base58-ish
// content ids, no whitespace, bounded length.
bool looks_like_content_hash(std::string_view value, std::size_t max_length);

}  // namespace regen::util
