#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include <vector>
#include "PatternMerger.h"

using namespace mkc_seasonality;
using Catch::Approx;

namespace
{
  SeasonalPattern makePattern(unsigned int startIn,
			      unsigned int length,
			      unsigned int numYears,
			      double winRate,
			      TradeDirection direction = TradeDirection::LONG,
			      bool supported = true,
			      unsigned int longest = 3)
  {
    return SeasonalPattern("EURUSD=X", direction, startIn, length, numYears,
			   winRate, 0.01, 1.0, winRate, supported, longest);
  }
}

TEST_CASE("PatternMerger passes single patterns through in order", "[PatternMerger]")
{
  std::vector<SeasonalPattern> patterns = {makePattern(5, 10, 8, 0.8),
					   makePattern(0, 7, 6, 0.9),
					   makePattern(2, 12, 9, 0.85)};

  std::vector<SeasonalPattern> merged = PatternMerger::merge(patterns);

  REQUIRE(merged.size() == 3);
  REQUIRE(merged[0] == patterns[0]);
  REQUIRE(merged[1] == patterns[1]);
  REQUIRE(merged[2] == patterns[2]);

  REQUIRE(PatternMerger::merge(std::vector<SeasonalPattern>()).empty());
}

TEST_CASE("PatternMerger weights by number of years", "[PatternMerger]")
{
  std::vector<SeasonalPattern> patterns = {makePattern(3, 7, 8, 0.8, TradeDirection::LONG, false, 4),
					   makePattern(1, 20, 10, 0.9),
					   makePattern(3, 10, 4, 0.9, TradeDirection::LONG, true, 2)};

  std::vector<SeasonalPattern> merged = PatternMerger::merge(patterns);

  REQUIRE(merged.size() == 2);
  REQUIRE(merged[0].getStartIn() == 3);
  REQUIRE(merged[1] == patterns[1]);

  const SeasonalPattern& combined = merged[0];
  REQUIRE(combined.getAsset() == "EURUSD=X");
  REQUIRE(combined.getWinRate() == Approx((0.8 * 8 + 0.9 * 4) / 12.0));
  REQUIRE(combined.getCycleWinRate() == Approx((0.8 * 8 + 0.9 * 4) / 12.0));
  REQUIRE(combined.getPhaseLength() == 8);
  REQUIRE(combined.getNumYears() == 8);
  REQUIRE(combined.getLongestStreak() == 4);
  REQUIRE(combined.isCycleSupported());
  REQUIRE(combined.getAverageReturn() == Approx(0.01));
  REQUIRE(combined.getSharpeAnnualized() == Approx(1.0));
}

TEST_CASE("PatternMerger direction vote", "[PatternMerger]")
{
  SECTION("majority wins")
    {
      std::vector<SeasonalPattern> group = {makePattern(0, 7, 5, 0.8, TradeDirection::SHORT),
					    makePattern(0, 8, 5, 0.8, TradeDirection::SHORT),
					    makePattern(0, 9, 5, 0.8, TradeDirection::LONG)};

      SeasonalPattern merged = PatternMerger::mergeGroup(group);
      REQUIRE(merged.getDirection() == TradeDirection::SHORT);
      REQUIRE(merged.getPhaseLength() == 8);
    }

  SECTION("a tie goes to long")
    {
      std::vector<SeasonalPattern> group = {makePattern(0, 7, 5, 0.8, TradeDirection::SHORT),
					    makePattern(0, 8, 5, 0.8, TradeDirection::LONG)};

      REQUIRE(PatternMerger::mergeGroup(group).getDirection() == TradeDirection::LONG);
    }
}

TEST_CASE("PatternMerger edge cases", "[PatternMerger]")
{
  SECTION("members without years are averaged equally")
    {
      std::vector<SeasonalPattern> group = {makePattern(0, 7, 0, 0.6),
					    makePattern(0, 11, 0, 1.0)};

      SeasonalPattern merged = PatternMerger::mergeGroup(group);
      REQUIRE(merged.getWinRate() == Approx(0.8));
      REQUIRE(merged.getPhaseLength() == 9);
      REQUIRE(merged.getNumYears() == 0);
    }

  SECTION("empty group")
    {
      REQUIRE_THROWS_AS(PatternMerger::mergeGroup(std::vector<SeasonalPattern>()), std::invalid_argument);
    }
}
