#include "chunkvault/security/MemoryWiper.hpp"
#include "chunkvault/security/ScopeWipe.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include "chunkvault/security/SecureEquals.hpp"
#include "chunkvault/security/SecureRandom.hpp"
#include "chunkvault/security/SecureString.hpp"
#include "chunkvault/security/ZeroAllocator.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <new>
#include <span>
#include <string_view>
#include <utility>

namespace
{

struct OwnsHeap
{
    std::unique_ptr<int> p;
};

template <typename T>
concept CanSecureWipe = requires(T buffer) { chunkvault::security::secureWipe(buffer); };

static_assert(CanSecureWipe<std::span<std::uint8_t>>);
static_assert(!CanSecureWipe<std::span<const std::uint8_t>>);
static_assert(!CanSecureWipe<std::span<OwnsHeap>>);

[[nodiscard]] bool allZero(std::span<const std::uint8_t> bytes)
{
    return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0U; });
}

constexpr std::uint8_t g_kFill{ 0xA5U };

} // namespace

TEST(SecureWipe, ZerosChunkKeySizedBuffer)
{
    std::array<std::uint8_t, 32> key{};
    key.fill(g_kFill);

    chunkvault::security::secureWipe(std::span{ key });
    EXPECT_TRUE(allZero(key));
}

TEST(SecureWipe, ZerosWiderTypes)
{
    std::array<std::uint64_t, 4> words{ 1U, 2U, 3U, std::numeric_limits<std::uint64_t>::max() };

    chunkvault::security::secureWipe(std::span{ words });
    for (const auto w : words)
    {
        EXPECT_EQ(w, 0U);
    }
}

TEST(SecureWipe, EmptySpanIsNoOp)
{
    chunkvault::security::secureWipe(std::span<std::byte>{});
}

TEST(ScopeWipe, WipesWhenLeavingScope)
{
    std::array<std::uint8_t, 16> iv{};
    iv.fill(g_kFill);
    {
        auto guard = chunkvault::security::scopeWipe(std::span{ iv });
        EXPECT_FALSE(allZero(iv));
    }
    EXPECT_TRUE(allZero(iv));
}

TEST(ScopeWipe, MovedGuardWipesOnlyOnce)
{
    chunkvault::security::SecureBuffer plain(64U, g_kFill);
    {
        auto outer = chunkvault::security::scopeWipe(plain);
        {
            auto inner{ std::move(outer) };
            EXPECT_FALSE(allZero(chunkvault::security::asSpan(std::as_const(plain))));
        }
        EXPECT_TRUE(allZero(chunkvault::security::asSpan(std::as_const(plain))));
        plain.assign(64U, g_kFill);
    }
    // The moved-from guard owned nothing.
    EXPECT_FALSE(allZero(chunkvault::security::asSpan(std::as_const(plain))));
}

TEST(ScopeWipe, ReassignmentWipesThePreviousRange)
{
    std::array<std::uint8_t, 8> first{};
    std::array<std::uint8_t, 8> second{};
    first.fill(g_kFill);
    second.fill(g_kFill);
    {
        auto guard = chunkvault::security::scopeWipe(std::span{ first });
        guard = chunkvault::security::scopeWipe(std::span{ second });
        EXPECT_TRUE(allZero(first));
        EXPECT_FALSE(allZero(second));
    }
    EXPECT_TRUE(allZero(second));
}

TEST(ScopeWipe, CoversSecureString)
{
    auto pass = chunkvault::security::secureStringFrom("hunter2");
    {
        auto guard = chunkvault::security::scopeWipe(pass);
    }
    ASSERT_EQ(pass.size(), 7U);
    EXPECT_TRUE(std::all_of(pass.begin(), pass.end(), [](char c) { return c == '\0'; }));
}

TEST(SecureBuffer, SecureReleaseEmptiesAndDropsCapacity)
{
    auto buffer = chunkvault::security::secureBufferFrom(std::array<std::uint8_t, 3>{ 1U, 2U, 3U });
    ASSERT_EQ(buffer.size(), 3U);

    chunkvault::security::secureRelease(buffer);
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.capacity(), 0U);
}

TEST(SecureString, ViewsAndRelease)
{
    const chunkvault::security::SecureString empty{};
    EXPECT_TRUE(chunkvault::security::asStringView(empty).empty());

    auto text = chunkvault::security::secureStringFrom("QUJD");
    EXPECT_EQ(chunkvault::security::asStringView(text), std::string_view{ "QUJD" });
    EXPECT_EQ(chunkvault::security::asBytes(text).size(), 4U);

    chunkvault::security::secureRelease(text);
    EXPECT_TRUE(text.empty());
    EXPECT_EQ(text.capacity(), 0U);
}

TEST(SecureEquals, ComparesContentAndLength)
{
    const std::array<std::uint8_t, 4> a{ 1U, 2U, 3U, 4U };
    const std::array<std::uint8_t, 4> b{ 1U, 2U, 3U, 4U };
    const std::array<std::uint8_t, 4> c{ 1U, 2U, 3U, 5U };
    const std::array<std::uint8_t, 3> shorter{ 1U, 2U, 3U };

    EXPECT_TRUE(chunkvault::security::secureEquals(std::span{ a }, std::span{ b }));
    EXPECT_FALSE(chunkvault::security::secureEquals(std::span{ a }, std::span{ c }));
    EXPECT_FALSE(chunkvault::security::secureEquals(std::span<const std::uint8_t>{ a },
                                                    std::span<const std::uint8_t>{ shorter }));

    const auto bufA = chunkvault::security::secureBufferFrom(a);
    const auto bufC = chunkvault::security::secureBufferFrom(c);
    EXPECT_TRUE(chunkvault::security::secureEquals(bufA, chunkvault::security::secureBufferFrom(b)));
    EXPECT_FALSE(chunkvault::security::secureEquals(bufA, bufC));
}

TEST(ZeroAllocator, ZeroLengthAndOversizedRequests)
{
    chunkvault::security::ZeroAllocator<std::uint64_t> alloc{};
    EXPECT_EQ(alloc.allocate(0U), nullptr);
    alloc.deallocate(nullptr, 16U);

    EXPECT_THROW({ [[maybe_unused]] auto* p = alloc.allocate(std::numeric_limits<std::size_t>::max()); },
                 std::bad_array_new_length);
}

TEST(ZeroAllocator, RebindsAndComparesEqual)
{
    const chunkvault::security::ZeroAllocator<char> a{};
    const chunkvault::security::ZeroAllocator<std::uint8_t> b{ a };
    EXPECT_TRUE(a == b);
}

TEST(ZeroAllocator, GrowingBufferKeepsContents)
{
    chunkvault::security::SecureBuffer buffer{};
    for (std::size_t i{}; i < 4096U; ++i)
    {
        buffer.push_back(static_cast<std::uint8_t>(i));
    }
    EXPECT_EQ(buffer[255], 255U);
    EXPECT_EQ(buffer[4095], static_cast<std::uint8_t>(4095U));
}

TEST(SecureRandom, FillsAndDiffers)
{
    EXPECT_TRUE(chunkvault::security::secureRandomFill(std::span<std::uint8_t>{}));

    std::array<std::uint8_t, 32> a{};
    std::array<std::uint8_t, 32> b{};
    ASSERT_TRUE(chunkvault::security::secureRandomFill(std::span{ a }));
    ASSERT_TRUE(chunkvault::security::secureRandomFill(std::span{ b }));
    EXPECT_NE(a, b);
    EXPECT_FALSE(allZero(a));
}
