#include "pathforge/ascii-upper.hpp"

#include <gtest/gtest.h>

namespace pathforge {

template <typename T>
class AsciiUpperTest : public ::testing::Test {};

using MyTypes = ::testing::Types<char, unsigned char>;
TYPED_TEST_SUITE(AsciiUpperTest, MyTypes, );

TYPED_TEST(AsciiUpperTest, ToUpperTest) {
  using T = TypeParam;
  EXPECT_EQ(toupper(static_cast<T>('g')), static_cast<T>('G'));
  EXPECT_EQ(toupper(static_cast<T>('e')), static_cast<T>('E'));
  EXPECT_EQ(toupper(static_cast<T>(' ')), static_cast<T>(' '));

  EXPECT_EQ(toupper(static_cast<T>('T')), static_cast<T>('T'));
  EXPECT_EQ(toupper(static_cast<T>('2')), static_cast<T>('2'));
}

TEST(ToUpperAsciiTest, CanonicalizesVerbs) {
  EXPECT_EQ(ToUpperAscii("get"), "GET");
  EXPECT_EQ(ToUpperAscii("Delete"), "DELETE");
  EXPECT_EQ(ToUpperAscii("PUT"), "PUT");
  EXPECT_EQ(ToUpperAscii("m-search"), "M-SEARCH");
  EXPECT_EQ(ToUpperAscii(""), "");
}

TEST(ToUpperAsciiTest, IsUpperAscii) {
  static_assert(IsUpperAscii("OPTIONS"));
  static_assert(!IsUpperAscii("Options"));
  EXPECT_TRUE(IsUpperAscii("M-SEARCH"));
  EXPECT_TRUE(IsUpperAscii(""));
  EXPECT_FALSE(IsUpperAscii("get"));
}

}  // namespace pathforge
