#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PrimeGlyph {

auto EncodeBase64(std::span<uint8_t const> data) -> std::string;

// Returns nullopt on characters outside the standard alphabet or bad padding.
auto DecodeBase64(std::string_view text) -> std::optional<std::vector<uint8_t>>;

} // namespace PrimeGlyph
