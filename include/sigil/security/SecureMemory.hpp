#ifndef INCLUDE_SIGIL_SECURITY_SECUREMEMORY_HPP
#define INCLUDE_SIGIL_SECURITY_SECUREMEMORY_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sigil::security
{

// Overwrites memory in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Allocator that zeroes every block before handing it back to the heap.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        }
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& a, [[maybe_unused]] const ZeroAllocator<U>& b) noexcept
{
    return true;
}

// Key material and decrypted plaintext.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

// Passwords and decrypted text fields.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline SecureString secureStringFrom(std::span<const std::uint8_t> bytes)
{
    SecureString out{};
    out.reserve(bytes.size());
    for (const std::uint8_t b : bytes)
    {
        out.push_back(static_cast<char>(b));
    }
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

template <class T> void secureRelease(std::vector<T, ZeroAllocator<T>>& v) noexcept
{
    secureWipe(std::span<T>{ v });
    std::vector<T, ZeroAllocator<T>> empty{};
    v.swap(empty);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        const auto x{ std::to_integer<unsigned char>(a[i]) };
        const auto y{ std::to_integer<unsigned char>(b[i]) };
        diff = static_cast<unsigned char>(diff | static_cast<unsigned char>(x ^ y));
    }
    return diff == 0U;
}

[[nodiscard]] inline bool secureEquals(std::string_view a, std::string_view b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace sigil::security

#endif // INCLUDE_SIGIL_SECURITY_SECUREMEMORY_HPP
