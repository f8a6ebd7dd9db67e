#include "chunkvault/core/Base64.hpp"
#include <array>
#include <cstddef>

namespace chunkvault::core
{
namespace
{

constexpr std::string_view g_kAlphabet{ "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
constexpr std::uint8_t g_kInvalid{ 0xFFU };
constexpr char g_kPad{ '=' };
constexpr std::uint32_t g_kSextetMask{ 0x3FU };
constexpr std::uint32_t g_kByteMask{ 0xFFU };

constexpr std::array<std::uint8_t, 256> buildDecodeTable() noexcept
{
    std::array<std::uint8_t, 256> table{};
    table.fill(g_kInvalid);
    for (std::size_t i{}; i < g_kAlphabet.size(); ++i)
    {
        table[static_cast<unsigned char>(g_kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

constexpr std::array<std::uint8_t, 256> g_kDecodeTable{ buildDecodeTable() };

template <class Out> void encodeInto(std::span<const std::uint8_t> data, Out& out)
{
    out.reserve(((data.size() + 2U) / 3U) * 4U);

    std::size_t i{};
    for (; i + 2U < data.size(); i += 3U)
    {
        const std::uint32_t triple{ (static_cast<std::uint32_t>(data[i]) << 16U) |
                                    (static_cast<std::uint32_t>(data[i + 1U]) << 8U) |
                                    static_cast<std::uint32_t>(data[i + 2U]) };
        out.push_back(g_kAlphabet[(triple >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(triple >> 12U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(triple >> 6U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[triple & g_kSextetMask]);
    }

    const std::size_t rest{ data.size() - i };
    if (rest == 1U)
    {
        const std::uint32_t triple{ static_cast<std::uint32_t>(data[i]) << 16U };
        out.push_back(g_kAlphabet[(triple >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(triple >> 12U) & g_kSextetMask]);
        out.push_back(g_kPad);
        out.push_back(g_kPad);
    }
    else if (rest == 2U)
    {
        const std::uint32_t triple{ (static_cast<std::uint32_t>(data[i]) << 16U) |
                                    (static_cast<std::uint32_t>(data[i + 1U]) << 8U) };
        out.push_back(g_kAlphabet[(triple >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(triple >> 12U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(triple >> 6U) & g_kSextetMask]);
        out.push_back(g_kPad);
    }
}

template <class Out> [[nodiscard]] bool decodeInto(std::string_view text, Out& out)
{
    if (text.size() % 4U != 0U)
    {
        return false;
    }

    std::size_t padding{};
    if (!text.empty() && text.back() == g_kPad)
    {
        ++padding;
        if (text.size() >= 2U && text[text.size() - 2U] == g_kPad)
        {
            ++padding;
        }
    }

    out.reserve((text.size() / 4U) * 3U);

    for (std::size_t i{}; i < text.size(); i += 4U)
    {
        const bool lastQuad{ i + 4U == text.size() };
        const std::size_t quadPadding{ lastQuad ? padding : 0U };

        std::uint32_t quad{};
        for (std::size_t j{}; j < 4U; ++j)
        {
            const char c{ text[i + j] };
            std::uint32_t sextet{};
            if (j >= 4U - quadPadding)
            {
                sextet = 0U;
            }
            else
            {
                const std::uint8_t decoded{ g_kDecodeTable[static_cast<unsigned char>(c)] };
                if (decoded == g_kInvalid)
                {
                    return false;
                }
                sextet = decoded;
            }
            quad = (quad << 6U) | sextet;
        }

        out.push_back(static_cast<std::uint8_t>((quad >> 16U) & g_kByteMask));
        if (quadPadding < 2U)
        {
            out.push_back(static_cast<std::uint8_t>((quad >> 8U) & g_kByteMask));
        }
        else if (((quad >> 8U) & g_kByteMask) != 0U)
        {
            return false;
        }
        if (quadPadding < 1U)
        {
            out.push_back(static_cast<std::uint8_t>(quad & g_kByteMask));
        }
        else if ((quad & g_kByteMask) != 0U)
        {
            return false;
        }
    }
    return true;
}

} // namespace

[[nodiscard]] std::string encodeBase64(std::span<const std::uint8_t> data)
{
    std::string out{};
    encodeInto(data, out);
    return out;
}

[[nodiscard]] chunkvault::security::SecureString encodeBase64Secure(std::span<const std::uint8_t> data)
{
    chunkvault::security::SecureString out{};
    encodeInto(data, out);
    return out;
}

[[nodiscard]] std::optional<std::vector<std::uint8_t>> decodeBase64(std::string_view text)
{
    std::vector<std::uint8_t> out{};
    if (!decodeInto(text, out))
    {
        return std::nullopt;
    }
    return out;
}

[[nodiscard]] std::optional<chunkvault::security::SecureBuffer> decodeBase64Secure(std::string_view text)
{
    chunkvault::security::SecureBuffer out{};
    if (!decodeInto(text, out))
    {
        chunkvault::security::secureRelease(out);
        return std::nullopt;
    }
    return out;
}

} // namespace chunkvault::core
