#ifndef INCLUDE_CHUNKVAULT_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_CHUNKVAULT_SECURITY_SCOPEWIPE_HPP

#include "chunkvault/security/MemoryWiper.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include "chunkvault/security/SecureString.hpp"
#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>

namespace chunkvault::security
{

// Wipes a borrowed byte range when the guard leaves scope. A moved-from guard owns nothing.
// The range must outlive the guard and must not be reallocated while guarded.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ std::exchange(other.m_bytes, {}) }
    {
    }

    // Wipes what this guard held before taking over the other range.
    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = std::exchange(other.m_bytes, {});
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

private:
    std::span<std::byte> m_bytes;
};

template <typename T, std::size_t Extent>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipe(std::span<T, Extent> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(bytes) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return scopeWipe(std::span{ b });
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return scopeWipe(std::span{ s });
}

} // namespace chunkvault::security

#endif // INCLUDE_CHUNKVAULT_SECURITY_SCOPEWIPE_HPP
