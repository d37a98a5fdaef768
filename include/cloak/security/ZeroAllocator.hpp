#ifndef INCLUDE_CLOAK_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_CLOAK_SECURITY_ZEROALLOCATOR_HPP

#include "cloak/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace cloak::security
{
// Allocator behind SecureString and SecureBuffer, and so behind every copy a
// SensitiveValue hands out.
//
// SensitiveValue wipes its own content explicitly on destruction. That does not
// cover blocks a vector drops while growing, or a getValue() copy that the caller
// simply lets go out of scope. deallocate() wipes every block with secureWipe
// before freeing it, so none of those reach the heap still holding a secret.
//
// Stateless: all instances compare equal and rebinding keeps no state.
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
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& lhs,
                          [[maybe_unused]] const ZeroAllocator<U>& rhs) noexcept
{
    return true;
}

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_ZEROALLOCATOR_HPP
