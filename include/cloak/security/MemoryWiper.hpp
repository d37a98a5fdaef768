#ifndef INCLUDE_CLOAK_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_CLOAK_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace cloak::security
{
// Zeroes the bytes behind a SensitiveValue (or any other secret buffer) before
// its storage goes back to the allocator.
//
// Linux uses explicit_bzero and Windows SecureZeroMemory; both survive dead-store
// elimination. Every other platform gets detail::xorWipe, which is best effort:
// the compiler may still keep copies it made on its own. Never fails, never throws.
void secureWipe(std::span<std::byte> bytes) noexcept;

// Typed views (e.g. the char storage of a SecureString) are wiped as raw bytes.
// Const or non-trivially-copyable element types are rejected at compile time.
template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

namespace detail
{
// Portable fallback behind secureWipe: every byte b is overwritten with b ^ b
// through a volatile pointer. Built everywhere so it can be tested on hosts
// that never select it.
void xorWipe(std::span<std::byte> bytes) noexcept;
} // namespace detail

} // namespace cloak::security
#endif // INCLUDE_CLOAK_SECURITY_MEMORYWIPER_HPP
