#include "quantize.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                      \
  do {                                                                                         \
    if (!(cond)) {                                                                             \
      ++g_failures;                                                                            \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";    \
    }                                                                                          \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                        \
  do {                                                                                         \
    const auto _a = (a);                                                                       \
    const auto _b = (b);                                                                       \
    if (!(_a == _b)) {                                                                         \
      ++g_failures;                                                                            \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b \
                << "\n";                                                                       \
    }                                                                                          \
  } while (0)

#define ASSERT_TRUE(cond)                                                                      \
  do {                                                                                         \
    if (!(cond)) {                                                                             \
      ++g_failures;                                                                            \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";    \
      return;                                                                                  \
    }                                                                                          \
  } while (0)

namespace {

// Deterministic pseudo-random colors
std::vector<Color> MakeNoiseColors(size_t count, uint32_t seed)
{
  std::vector<Color> colors;
  uint32_t state = seed;
  for (size_t i = 0; i < count; ++i) {
    state = state * 1664525u + 1013904223u;
    colors.push_back({static_cast<uint8_t>(state >> 24), static_cast<uint8_t>(state >> 16),
                      static_cast<uint8_t>(state >> 8)});
  }
  return colors;
}

bool Contains(const Palette& palette, const Color& c)
{
  return std::find(palette.begin(), palette.end(), c) != palette.end();
}

void TestSplitDepth()
{
  EXPECT_EQ(split_depth(0), 0);
  EXPECT_EQ(split_depth(1), 0);
  EXPECT_EQ(split_depth(2), 1);
  EXPECT_EQ(split_depth(3), 2);
  EXPECT_EQ(split_depth(4), 2);
  EXPECT_EQ(split_depth(5), 3);
  EXPECT_EQ(split_depth(24), 5);
  EXPECT_EQ(split_depth(32), 5);
  EXPECT_EQ(split_depth(33), 6);
  EXPECT_EQ(split_depth(256), 8);
}

void TestVisibleColorsUsesStrictThreshold()
{
  std::vector<Rgba> cells = {
      {10, 20, 30, 0},
      {40, 50, 60, 128},
      {70, 80, 90, 129},
      {1, 2, 3, 255},
  };
  std::vector<Color> colors = visible_colors(cells);
  ASSERT_TRUE(colors.size() == 2);
  EXPECT_EQ(colors[0], (Color{70, 80, 90}));
  EXPECT_EQ(colors[1], (Color{1, 2, 3}));
}

void TestNonPositiveColorCountGivesNoPalette()
{
  std::vector<Color> colors = {{1, 2, 3}, {200, 100, 50}};
  EXPECT_TRUE(median_cut(colors, 0).empty());
  EXPECT_TRUE(median_cut(colors, -3).empty());

  std::vector<Rgba> cells = {{1, 2, 3, 255}};
  EXPECT_TRUE(median_cut_quantize(cells, 0).empty());
  EXPECT_TRUE(median_cut_quantize(cells, -1).empty());
}

void TestEmptyInputGivesNoPalette()
{
  EXPECT_TRUE(median_cut({}, 24).empty());

  std::vector<Rgba> transparent(25, Rgba{255, 255, 255, 0});
  EXPECT_TRUE(median_cut_quantize(transparent, 24).empty());
}

void TestBlackWhiteSplitsIntoTwo()
{
  std::vector<Color> colors = {{0, 0, 0}, {255, 255, 255}, {0, 0, 0}, {255, 255, 255}};
  Palette palette = median_cut(colors, 2);
  ASSERT_TRUE(palette.size() == 2);
  EXPECT_EQ(palette[0], (Color{0, 0, 0}));
  EXPECT_EQ(palette[1], (Color{255, 255, 255}));
}

void TestGreenWinsTieOverBlue()
{
  // R range 0, G and B range 10: split must sort on G
  std::vector<Color> colors = {{0, 10, 0}, {0, 0, 10}, {0, 0, 0}, {0, 10, 10}};
  Palette palette = median_cut(colors, 2);
  ASSERT_TRUE(palette.size() == 2);
  EXPECT_EQ(palette[0], (Color{0, 0, 5}));
  EXPECT_EQ(palette[1], (Color{0, 10, 5}));
}

void TestRedWinsTieOverGreenAndBlue()
{
  std::vector<Color> colors = {{0, 9, 0}, {9, 0, 0}, {0, 0, 9}, {9, 9, 9}};
  Palette palette = median_cut(colors, 2);
  ASSERT_TRUE(palette.size() == 2);
  // Sorted on R: (0,9,0) (0,0,9) | (9,0,0) (9,9,9)
  EXPECT_EQ(palette[0], (Color{0, 5, 5}));
  EXPECT_EQ(palette[1], (Color{9, 5, 5}));
}

void TestDegenerateRangeStillSplits()
{
  std::vector<Color> colors(100, Color{255, 0, 0});
  Palette palette = median_cut(colors, 24);
  EXPECT_EQ(palette.size(), static_cast<size_t>(24));
  for (const auto& c : palette) {
    EXPECT_EQ(c, (Color{255, 0, 0}));
  }

  std::vector<Rgba> cells(100, Rgba{255, 0, 0, 255});
  Palette collapsed = median_cut_quantize(cells, 24);
  ASSERT_TRUE(collapsed.size() == 1);
  EXPECT_EQ(collapsed[0], (Color{255, 0, 0}));
}

void TestTruncatesToRequestedCount()
{
  std::vector<Color> colors = {{120, 0, 0}, {0, 0, 0}, {80, 0, 0}, {40, 0, 0}};
  Palette palette = median_cut(colors, 3);
  ASSERT_TRUE(palette.size() == 3);
  EXPECT_EQ(palette[0], (Color{0, 0, 0}));
  EXPECT_EQ(palette[1], (Color{40, 0, 0}));
  EXPECT_EQ(palette[2], (Color{80, 0, 0}));
}

void TestEmptyLeavesCountTowardTruncation()
{
  // Leaves are [] [0] [] [100]; keeping the first three leaves only one color
  std::vector<Color> colors = {{0, 0, 0}, {100, 0, 0}};
  Palette palette = median_cut(colors, 3);
  ASSERT_TRUE(palette.size() == 1);
  EXPECT_EQ(palette[0], (Color{0, 0, 0}));

  Palette single = median_cut({{10, 20, 30}}, 4);
  ASSERT_TRUE(single.size() == 1);
  EXPECT_EQ(single[0], (Color{10, 20, 30}));
}

void TestBucketMeanRoundsHalfUp()
{
  Palette half = median_cut({{0, 0, 0}, {1, 1, 1}}, 1);
  ASSERT_TRUE(half.size() == 1);
  EXPECT_EQ(half[0], (Color{1, 1, 1}));

  Palette third = median_cut({{0, 0, 0}, {0, 3, 0}, {1, 0, 2}}, 1);
  ASSERT_TRUE(third.size() == 1);
  EXPECT_EQ(third[0], (Color{0, 1, 1}));
}

void TestPaletteSizeBounds()
{
  std::vector<Color> colors = MakeNoiseColors(300, 7);
  for (int k = 1; k <= 64; ++k) {
    Palette palette = median_cut(colors, k);
    EXPECT_TRUE(!palette.empty());
    EXPECT_TRUE(palette.size() <= static_cast<size_t>(k));
  }
}

void TestPaletteLengthNonDecreasing()
{
  std::vector<Color> colors = MakeNoiseColors(1000, 42);
  size_t previous = 0;
  for (int k = 24; k <= 256; ++k) {
    size_t length = median_cut(colors, k).size();
    EXPECT_TRUE(length >= previous);
    previous = length;
  }
  EXPECT_EQ(previous, static_cast<size_t>(256));
}

void TestDeterministic()
{
  std::vector<Color> colors = MakeNoiseColors(500, 99);
  EXPECT_TRUE(median_cut(colors, 37) == median_cut(colors, 37));

  std::vector<Rgba> cells;
  for (const auto& c : colors) cells.push_back({c.r, c.g, c.b, 255});
  EXPECT_TRUE(median_cut_quantize(cells, 100) == median_cut_quantize(cells, 100));
}

void TestNearestColorPrefersFirstOnTie()
{
  Palette palette = {{0, 0, 0}, {2, 0, 0}, {1, 0, 0}};
  EXPECT_EQ(nearest_color_index({1, 0, 0}, palette), 2);

  Palette tied = {{0, 0, 0}, {2, 0, 0}};
  EXPECT_EQ(nearest_color_index({1, 0, 0}, tied), 0);
  EXPECT_EQ(nearest_color({1, 0, 0}, tied), (Color{0, 0, 0}));
}

void TestNearestColorIsPaletteMember()
{
  std::vector<Color> colors = MakeNoiseColors(200, 3);
  Palette palette = median_cut(colors, 24);
  ASSERT_TRUE(!palette.empty());
  for (const auto& c : MakeNoiseColors(200, 11)) {
    EXPECT_TRUE(Contains(palette, nearest_color(c, palette)));
  }
}

void TestNearestColorRejectsEmptyPalette()
{
  bool threw = false;
  try {
    (void)nearest_color({1, 2, 3}, Palette{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
}

void TestApplyPaletteKeepsAlpha()
{
  std::vector<Rgba> cells = {{10, 10, 10, 40}, {250, 240, 245, 255}};
  Palette palette = {{0, 0, 0}, {255, 255, 255}};
  std::vector<Rgba> mapped = apply_palette(cells, palette);
  ASSERT_TRUE(mapped.size() == 2);
  EXPECT_EQ(mapped[0], (Rgba{0, 0, 0, 40}));
  EXPECT_EQ(mapped[1], (Rgba{255, 255, 255, 255}));

  EXPECT_TRUE(apply_palette(cells, Palette{}) == cells);
}

} // namespace

int main()
{
  TestSplitDepth();
  TestVisibleColorsUsesStrictThreshold();
  TestNonPositiveColorCountGivesNoPalette();
  TestEmptyInputGivesNoPalette();
  TestBlackWhiteSplitsIntoTwo();
  TestGreenWinsTieOverBlue();
  TestRedWinsTieOverGreenAndBlue();
  TestDegenerateRangeStillSplits();
  TestTruncatesToRequestedCount();
  TestEmptyLeavesCountTowardTruncation();
  TestBucketMeanRoundsHalfUp();
  TestPaletteSizeBounds();
  TestPaletteLengthNonDecreasing();
  TestDeterministic();
  TestNearestColorPrefersFirstOnTie();
  TestNearestColorIsPaletteMember();
  TestNearestColorRejectsEmptyPalette();
  TestApplyPaletteKeepsAlpha();

  if (g_failures == 0) {
    std::cout << "pixelgrid_quantize_tests: OK\n";
    return 0;
  }

  std::cerr << "pixelgrid_quantize_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
