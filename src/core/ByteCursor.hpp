#ifndef CHUNKVAULT_SRC_CORE_BYTECURSOR_HPP
#define CHUNKVAULT_SRC_CORE_BYTECURSOR_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Little-endian field cursors shared by the manifest and wrapped-key formats.
namespace chunkvault::core::detail
{

class ByteWriter final
{
public:
    explicit ByteWriter(std::vector<std::uint8_t>& out) noexcept : m_out(&out)
    {
    }

    void raw(std::span<const std::uint8_t> bytes)
    {
        m_out->insert(m_out->end(), bytes.begin(), bytes.end());
    }

    void raw(std::span<const std::byte> bytes)
    {
        raw(std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size() });
    }

    void u32(std::uint32_t v)
    {
        putLE(v, sizeof(v));
    }

    void u64(std::uint64_t v)
    {
        putLE(v, sizeof(v));
    }

private:
    void putLE(std::uint64_t v, std::size_t width)
    {
        for (std::size_t i{}; i < width; ++i)
        {
            m_out->push_back(static_cast<std::uint8_t>(v >> (8U * i)));
        }
    }

    std::vector<std::uint8_t>* m_out{ nullptr };
};

// Bounds-checked: a read past the end sets failed() and yields zeros / an empty span.
class ByteReader final
{
public:
    explicit ByteReader(std::span<const std::uint8_t> in) noexcept : m_in(in)
    {
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_offset;
    }

    [[nodiscard]] bool failed() const noexcept
    {
        return m_failed;
    }

    [[nodiscard]] std::span<const std::uint8_t> raw(std::size_t n) noexcept
    {
        if (n > remaining())
        {
            m_failed = true;
            m_offset = m_in.size();
            return {};
        }
        const auto out{ m_in.subspan(m_offset, n) };
        m_offset += n;
        return out;
    }

    [[nodiscard]] std::uint32_t u32() noexcept
    {
        return static_cast<std::uint32_t>(getLE(sizeof(std::uint32_t)));
    }

    [[nodiscard]] std::uint64_t u64() noexcept
    {
        return getLE(sizeof(std::uint64_t));
    }

private:
    [[nodiscard]] std::uint64_t getLE(std::size_t width) noexcept
    {
        const auto bytes{ raw(width) };
        std::uint64_t v{ 0U };
        for (std::size_t i{}; i < bytes.size(); ++i)
        {
            v |= static_cast<std::uint64_t>(bytes[i]) << (8U * i);
        }
        return v;
    }

    std::span<const std::uint8_t> m_in;
    std::size_t m_offset{};
    bool m_failed{ false };
};

} // namespace chunkvault::core::detail

#endif // CHUNKVAULT_SRC_CORE_BYTECURSOR_HPP
