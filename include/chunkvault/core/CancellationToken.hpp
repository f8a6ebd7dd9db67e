#ifndef INCLUDE_CHUNKVAULT_CORE_CANCELLATIONTOKEN_HPP
#define INCLUDE_CHUNKVAULT_CORE_CANCELLATIONTOKEN_HPP

#include <atomic>

namespace chunkvault::core
{

// Set from any thread; pipelines check it before each chunk.
class CancellationToken final
{
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) = delete;
    CancellationToken& operator=(CancellationToken&&) = delete;
    ~CancellationToken() = default;

    void cancel() noexcept
    {
        m_cancelled.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool isCancelled() const noexcept
    {
        return m_cancelled.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> m_cancelled{ false };
};

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_CANCELLATIONTOKEN_HPP
