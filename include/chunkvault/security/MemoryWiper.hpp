#ifndef INCLUDE_CHUNKVAULT_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_CHUNKVAULT_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace chunkvault::security
{

// Zeroes memory in a way the optimizer may not elide, even right before the memory is freed.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T, std::size_t Extent>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T, Extent> values) noexcept
{
    secureWipe(std::span<std::byte>{ std::as_writable_bytes(values) });
}

} // namespace chunkvault::security

#endif // INCLUDE_CHUNKVAULT_SECURITY_MEMORYWIPER_HPP
