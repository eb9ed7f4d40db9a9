#include <gtest/gtest.h>

#include "store/NoteId.h"

TEST(NoteIdTest, ParsesDigits) {
    NoteId id;
    ASSERT_TRUE(NoteId::parse("42", id));
    EXPECT_EQ(id.value(), 42u);
    EXPECT_EQ(id.to_string(), "42");

    ASSERT_TRUE(NoteId::parse("007", id));
    EXPECT_EQ(id.value(), 7u);
}

TEST(NoteIdTest, ParsesMaxValue) {
    NoteId id;
    ASSERT_TRUE(NoteId::parse("18446744073709551615", id));
    EXPECT_EQ(id.value(), 18446744073709551615ULL);
}

// 溢出、空串、非数字字符都解析失败，且不修改输出参数
TEST(NoteIdTest, RejectsInvalidSegments) {
    NoteId id(5);
    EXPECT_FALSE(NoteId::parse("", id));
    EXPECT_FALSE(NoteId::parse("18446744073709551616", id));
    EXPECT_FALSE(NoteId::parse("-1", id));
    EXPECT_FALSE(NoteId::parse("+1", id));
    EXPECT_FALSE(NoteId::parse("1a", id));
    EXPECT_FALSE(NoteId::parse(" 1", id));
    EXPECT_FALSE(NoteId::parse("0x10", id));
    EXPECT_EQ(id.value(), 5u);
}

TEST(NoteIdTest, Comparison) {
    EXPECT_EQ(NoteId(3), NoteId(3));
    EXPECT_NE(NoteId(3), NoteId(4));
    EXPECT_TRUE(NoteId(3) < NoteId(4));
}
