#include <gtest/gtest.h>
#include <cstdint>
#include <string>

#include "../include/fold.hpp"
#include "../include/list_consumer.hpp"
#include "../include/range.hpp"
#include "../include/stringer.hpp"

namespace miniiter {
namespace {

uint32_t Add(uint32_t a, uint32_t b) { return a + b; }
uint32_t Mul(uint32_t a, uint32_t b) { return a * b; }

TEST(FoldTest, SumOverRange) {
    auto range = Range<uint32_t>::Create(1, 10, 1);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(Fold(Add, *range, uint32_t{17}), 17u + 1 + 2 + 3 + 4 + 5 + 6 + 7 + 8 + 9);
}

TEST(FoldTest, ProductOverRange) {
    auto range = Range<uint32_t>::Create(1, 10, 1);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(Fold(Mul, *range, uint32_t{1}), 362880u);
}

TEST(FoldTest, EvenSum) {
    auto range = Range<uint32_t>::Create(0, 10, 2);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(Fold(Add, *range, uint32_t{0}), 20u);
}

TEST(FoldTest, EmptyIteratorReturnsInit) {
    auto range = Range<int>::Create(5, 5, 1);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(Fold([](int, int) { return -1; }, *range, 42), 42);

    Stringer stringer("");
    EXPECT_EQ(Fold([](std::string acc, uint8_t) { return acc + "x"; }, stringer, std::string("init")),
              "init");
}

TEST(FoldTest, LeavesIteratorExhausted) {
    auto range = Range<int>::Create(0, 4, 1);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(Fold([](int acc, int v) { return acc + v; }, *range, 0), 6);
    EXPECT_FALSE(range->Next().has_value());
    EXPECT_EQ(Fold([](int acc, int v) { return acc + v; }, *range, 100), 100);
}

TEST(FoldTest, PreservesProductionOrder) {
    Stringer stringer("abc");
    auto reversed = Fold([](std::string acc, uint8_t b) { return std::string(1, static_cast<char>(b)) + acc; },
                         stringer, std::string());
    EXPECT_EQ(reversed, "cba");
}

TEST(FoldTest, AccumulatorTypeDiffersFromElement) {
    SinglyLinkedList<std::string> list;
    list.PushFront("ccc");
    list.PushFront("bb");
    list.PushFront("a");
    ListConsumer<std::string> consumer(std::move(list));

    size_t total = Fold([](size_t acc, const std::string& s) { return acc + s.size(); },
                        consumer, size_t{0});
    EXPECT_EQ(total, 6u);
    EXPECT_TRUE(consumer.List().Empty());
}

TEST(FoldTest, DescendingRange) {
    auto range = Range<int64_t>::Create(10, 0, -3);
    ASSERT_TRUE(range.has_value());
    // 10 + 7 + 4 + 1
    EXPECT_EQ(Fold([](int64_t acc, int64_t v) { return acc + v; }, *range, int64_t{0}), 22);
}

} // namespace
} // namespace miniiter
