#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <zlib.h>

#include "../include/numeric.hpp"

namespace miniiter {
namespace {

TEST(FactorialTest, ExcludesUpperBound) {
    EXPECT_EQ(Factorial(10), 1u * 2 * 3 * 4 * 5 * 6 * 7 * 8 * 9);
}

TEST(FactorialTest, SmallInputs) {
    EXPECT_EQ(Factorial(0), 1u);
    EXPECT_EQ(Factorial(1), 1u);
    EXPECT_EQ(Factorial(2), 1u);
    EXPECT_EQ(Factorial(3), 2u);
    EXPECT_EQ(Factorial(6), 120u);
}

TEST(FactorialTest, NeverReportsError) {
    IterError error = IterError::kInvalidStepSize;
    auto result = Factorial(13, &error);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 479001600u);
}

TEST(FactorialTest, WrapsPastUint32) {
    // 1 * ... * 13 == 6227020800, which is 1932053504 modulo 2^32
    EXPECT_EQ(Factorial(14), 1932053504u);
}

TEST(Crc32Test, KnownCheckValue) {
    EXPECT_EQ(Crc32("123456789"), 0xCBF43926u);
}

TEST(Crc32Test, EmptyInput) {
    EXPECT_EQ(Crc32(""), 0u);
}

TEST(Crc32Test, MatchesOneShotZlib) {
    std::string data;
    for (int i = 0; i < 4096; ++i) {
        data.push_back(static_cast<char>((i * 31) & 0xFF));
    }
    uLong expected = crc32(0L, reinterpret_cast<const Bytef*>(data.data()),
                           static_cast<uInt>(data.size()));
    EXPECT_EQ(Crc32(data), static_cast<uint32_t>(expected));
}

} // namespace
} // namespace miniiter
