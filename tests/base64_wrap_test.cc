#include "plistemit/base64_wrap.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace plistemit {
namespace {

    static std::span<const std::byte> as_bytes(std::string_view s) noexcept
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(s.data()), s.size());
    }

    static int decode_char(char c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '+') {
            return 62;
        }
        if (c == '/') {
            return 63;
        }
        return -1;
    }

    // Strips newlines and decodes; fails the test on malformed input.
    static std::vector<std::byte> unwrap_and_decode(std::string_view wrapped)
    {
        std::string compact;
        for (size_t i = 0; i < wrapped.size(); ++i) {
            if (wrapped[i] != '\n') {
                compact.push_back(wrapped[i]);
            }
        }
        EXPECT_EQ(compact.size() % 4U, 0U);

        std::vector<std::byte> out;
        for (size_t i = 0; i + 4U <= compact.size(); i += 4U) {
            uint32_t acc = 0;
            uint32_t pad = 0;
            for (size_t j = 0; j < 4U; ++j) {
                const char c = compact[i + j];
                if (c == '=') {
                    pad += 1U;
                    acc <<= 6;
                    continue;
                }
                const int v = decode_char(c);
                EXPECT_GE(v, 0);
                acc = (acc << 6) | static_cast<uint32_t>(v < 0 ? 0 : v);
            }
            out.push_back(static_cast<std::byte>((acc >> 16) & 0xFF));
            if (pad < 2U) {
                out.push_back(static_cast<std::byte>((acc >> 8) & 0xFF));
            }
            if (pad < 1U) {
                out.push_back(static_cast<std::byte>(acc & 0xFF));
            }
        }
        return out;
    }

}  // namespace

TEST(Base64Wrap, EncodesStandardVectors)
{
    const std::string_view inputs[]   = { "", "f", "fo", "foo", "foob",
                                          "fooba", "foobar", "Canon" };
    const std::string_view expected[] = { "",         "Zg==",     "Zm8=",
                                          "Zm9v",     "Zm9vYg==", "Zm9vYmE=",
                                          "Zm9vYmFy", "Q2Fub24=" };
    for (size_t i = 0; i < std::size(inputs); ++i) {
        std::string out;
        append_base64(as_bytes(inputs[i]), &out);
        EXPECT_EQ(out, expected[i]) << "input: " << inputs[i];
    }
}


TEST(Base64Wrap, EmptyInputIsLeadingNewlineOnly)
{
    EXPECT_EQ(wrap_base64({}), "\n");
}


TEST(Base64Wrap, ShortInputIsOneLine)
{
    EXPECT_EQ(wrap_base64(as_bytes("abc")), "\nYWJj\n");
}


TEST(Base64Wrap, WrapsAtSixtyEightColumns)
{
    // 51 bytes encode to exactly 68 characters.
    const std::vector<std::byte> exact(51, std::byte { 0xAB });
    const std::string one = wrap_base64(exact);
    ASSERT_EQ(one.size(), 1U + 68U + 1U);
    EXPECT_EQ(one.front(), '\n');
    EXPECT_EQ(one.find('\n', 1), 69U);

    // 52 bytes encode to 72 characters: 68 + 4.
    const std::vector<std::byte> over(52, std::byte { 0xAB });
    const std::string two = wrap_base64(over);
    ASSERT_EQ(two.size(), 1U + 68U + 1U + 4U + 1U);
    EXPECT_EQ(two[69], '\n');
    EXPECT_EQ(two.back(), '\n');
}


TEST(Base64Wrap, EveryLineRespectsWidth)
{
    std::vector<std::byte> bytes(1000);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::byte>((i * 131U + 7U) & 0xFFU);
    }
    const std::string w = wrap_base64(bytes);
    ASSERT_FALSE(w.empty());
    ASSERT_EQ(w.front(), '\n');
    ASSERT_EQ(w.back(), '\n');

    size_t start = 1;
    while (start < w.size()) {
        const size_t nl = w.find('\n', start);
        ASSERT_NE(nl, std::string::npos);
        const size_t len = nl - start;
        EXPECT_GT(len, 0U);
        EXPECT_LE(len, static_cast<size_t>(kPlistDataLineWidth));
        if (nl + 1U < w.size()) {
            EXPECT_EQ(len, static_cast<size_t>(kPlistDataLineWidth));
        }
        start = nl + 1U;
    }
}


TEST(Base64Wrap, UnwrapDecodeRestoresInput)
{
    for (size_t n = 0; n < 300; n += 7) {
        std::vector<std::byte> bytes(n);
        for (size_t i = 0; i < n; ++i) {
            bytes[i] = static_cast<std::byte>((i * 37U + n) & 0xFFU);
        }
        EXPECT_EQ(unwrap_and_decode(wrap_base64(bytes)), bytes) << "n=" << n;
    }
}


TEST(Base64Wrap, HonorsCustomWidth)
{
    std::string out;
    append_wrapped_base64(as_bytes("foobar"), 4, &out);
    EXPECT_EQ(out, "\nZm9v\nYmFy\n");

    out.clear();
    append_wrapped_base64(as_bytes("foobar"), 0, &out);
    EXPECT_EQ(out, "\nZm9vYmFy\n");
}

}  // namespace plistemit
