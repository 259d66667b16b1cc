#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace regen::util {

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);
std::vector<std::string> split_words(std::string_view line);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::optional<std::uint64_t> parse_u64(std::string_view text);
std::uint64_t parse_u64_or(std::string_view text, std::uint64_t fallback);
bool parse_boolish(std::string_view text);

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);

}  // namespace regen::util
