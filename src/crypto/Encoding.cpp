#include "sigil/crypto/Encoding.hpp"

#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace sigil::crypto
{
namespace
{

constexpr std::uint8_t g_kNibbleShift{ 4U };
constexpr std::uint8_t g_kNibbleMask{ 0x0FU };

[[nodiscard]] int nibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool isBase64Char(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> g_kNibbleShift) & g_kNibbleMask]);
        out.push_back(kHex[b & g_kNibbleMask]);
    }
    return out;
}

bool isHex(std::string_view text) noexcept
{
    if ((text.size() % 2U) != 0U)
    {
        return false;
    }
    for (const char c : text)
    {
        if (nibble(c) < 0)
        {
            return false;
        }
    }
    return true;
}

std::optional<std::vector<std::uint8_t>> fromHex(std::string_view hex)
{
    if (!isHex(hex))
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2U);
    for (std::size_t i{}; i < hex.size(); i += 2U)
    {
        const int hi{ nibble(hex[i]) };
        const int lo{ nibble(hex[i + 1U]) };
        out.push_back(static_cast<std::uint8_t>((hi << g_kNibbleShift) | lo));
    }
    return out;
}

std::string toBase64(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3 - 3))
    {
        throw std::invalid_argument("base64: input too large");
    }

    std::string out(((bytes.size() + 2U) / 3U) * 4U + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    if (written < 0)
    {
        throw std::runtime_error("base64: EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<std::vector<std::uint8_t>> fromBase64(std::string_view text)
{
    if (text.empty() || (text.size() % 4U) != 0U ||
        text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }

    std::size_t padding{ 0U };
    for (std::size_t i{}; i < text.size(); ++i)
    {
        const char c{ text[i] };
        if (c == '=')
        {
            // Padding only in the last two positions.
            if (i + 2U < text.size())
            {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding > 0U || !isBase64Char(c))
        {
            return std::nullopt;
        }
    }

    std::vector<std::uint8_t> out((text.size() / 4U) * 3U);
    const int decoded{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                       static_cast<int>(text.size())) };
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding)
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

} // namespace sigil::crypto
