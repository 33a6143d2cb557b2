#include "focal/focal_presets.hpp"

#include <gtest/gtest.h>

namespace darkroom {
TEST(FocalPresetsTest, NamesAndShorthands) {
  EXPECT_EQ(ParseFocal("center"), (FocalPoint{50, 50}));
  EXPECT_EQ(ParseFocal("c"), (FocalPoint{50, 50}));
  EXPECT_EQ(ParseFocal("top"), (FocalPoint{50, 0}));
  EXPECT_EQ(ParseFocal("b"), (FocalPoint{50, 100}));
  EXPECT_EQ(ParseFocal("tl"), (FocalPoint{0, 0}));
  EXPECT_EQ(ParseFocal("br"), (FocalPoint{100, 100}));
}

TEST(FocalPresetsTest, SeparatorsAndCaseAreNormalized) {
  EXPECT_EQ(ParseFocal("Top Left"), (FocalPoint{0, 0}));
  EXPECT_EQ(ParseFocal("top-right"), (FocalPoint{100, 0}));
  EXPECT_EQ(ParseFocal("bottom_left"), (FocalPoint{0, 100}));
  EXPECT_EQ(ParseFocal("  bottom   right "), (FocalPoint{100, 100}));
}

TEST(FocalPresetsTest, NumericPairsAreClamped) {
  EXPECT_EQ(ParseFocal("30,70"), (FocalPoint{30, 70}));
  EXPECT_EQ(ParseFocal(" 30 , 70 "), (FocalPoint{30, 70}));
  EXPECT_EQ(ParseFocal("-20,150"), (FocalPoint{0, 100}));
}

TEST(FocalPresetsTest, UnknownInputIsNone) {
  EXPECT_FALSE(ParseFocal("middle").has_value());
  EXPECT_FALSE(ParseFocal("").has_value());
  EXPECT_FALSE(ParseFocal("a,b").has_value());
  EXPECT_FALSE(ParseFocal("10,").has_value());
}

TEST(FocalPresetsTest, PresetNamesListLongForms) {
  const auto names = FocalPresetNames();
  ASSERT_EQ(names.size(), 7u);
  EXPECT_EQ(names.front(), "center");
  EXPECT_EQ(names.back(), "bottom right");
}
}  // namespace darkroom
