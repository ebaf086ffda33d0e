#ifndef INCLUDE_SIGIL_CRYPTO_ENCODING_HPP
#define INCLUDE_SIGIL_CRYPTO_ENCODING_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::crypto
{

// Lowercase hex.
[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

// Accepts either case. Returns std::nullopt on odd length or a non-hex character.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> fromHex(std::string_view hex);

[[nodiscard]] bool isHex(std::string_view text) noexcept;

// Standard alphabet with padding.
[[nodiscard]] std::string toBase64(std::span<const std::uint8_t> bytes);

[[nodiscard]] std::optional<std::vector<std::uint8_t>> fromBase64(std::string_view text);

} // namespace sigil::crypto

#endif // INCLUDE_SIGIL_CRYPTO_ENCODING_HPP
