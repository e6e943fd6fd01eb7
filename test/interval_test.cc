#include "gtest/gtest.h"

#include <sstream>

#include "rezzy/interval.h"

using namespace rezzy;

TEST(interval, overlaps_half_open) {
  auto const a = interval{18 * 60, 19 * 60 + 30};

  EXPECT_TRUE(a.overlaps(interval{19 * 60, 20 * 60}));
  EXPECT_TRUE(a.overlaps(interval{17 * 60, 18 * 60 + 1}));
  EXPECT_TRUE(a.overlaps(interval{18 * 60 + 15, 18 * 60 + 45}));
  EXPECT_TRUE(a.overlaps(a));

  EXPECT_FALSE(a.overlaps(interval{19 * 60 + 30, 21 * 60}));
  EXPECT_FALSE(a.overlaps(interval{17 * 60, 18 * 60}));
  EXPECT_FALSE((interval{19 * 60 + 30, 21 * 60}.overlaps(a)));
}

TEST(interval, contains) {
  auto const a = interval{60, 120};
  EXPECT_TRUE(a.contains(interval{60, 120}));
  EXPECT_TRUE(a.contains(interval{90, 100}));
  EXPECT_FALSE(a.contains(interval{30, 100}));
  EXPECT_TRUE(a.contains(minutes_t{60}));
  EXPECT_FALSE(a.contains(minutes_t{120}));
  EXPECT_EQ(60, a.size());
}

TEST(interval, print) {
  std::stringstream ss;
  ss << interval{18 * 60, 19 * 60 + 30};
  EXPECT_EQ("[18:00, 19:30)", ss.str());
}
