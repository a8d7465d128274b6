#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include "PatternScanner.h"
#include "SyntheticSeasonalSeries.h"

using namespace mkc_seasonality;
using namespace boost::gregorian;
using Catch::Approx;

namespace
{
  // Reference date 2025-04-10 is day 100.
  ScanParameters springParameters(double minWinRate = 0.75, int daysFromToday = 0)
  {
    return ScanParameters(7, 15, minWinRate, 2010, 2019, daysFromToday, date(2025, Apr, 10));
  }
}

TEST_CASE("PatternScanner candidate start days", "[PatternScanner]")
{
  SECTION("reference day only")
    {
      auto days = PatternScanner<DecimalType>::candidateStartDays(date(2025, Apr, 10), 0);
      REQUIRE(days == std::vector<unsigned short>{100});
    }

  SECTION("consecutive days")
    {
      auto days = PatternScanner<DecimalType>::candidateStartDays(date(2025, Apr, 10), 3);
      REQUIRE(days == std::vector<unsigned short>{100, 101, 102, 103});
    }

  SECTION("wrapping past December 31")
    {
      auto days = PatternScanner<DecimalType>::candidateStartDays(date(2025, Dec, 30), 3);
      REQUIRE(days == std::vector<unsigned short>{1, 2, 364, 365});

      auto leapDays = PatternScanner<DecimalType>::candidateStartDays(date(2024, Dec, 30), 2);
      REQUIRE(leapDays == std::vector<unsigned short>{1, 365, 366});
    }

  SECTION("one year ahead without a leap day")
    {
      auto days = PatternScanner<DecimalType>::candidateStartDays(date(2025, Apr, 10), 365);
      REQUIRE(days.size() == 365);
      REQUIRE(days.front() == 1);
      REQUIRE(days.back() == 365);
    }

  SECTION("far ahead covers every day of the year")
    {
      std::vector<unsigned short> everyDay;
      for (unsigned short day = 1; day <= 366; day++)
	everyDay.push_back(day);

      REQUIRE(PatternScanner<DecimalType>::candidateStartDays(date(2025, Apr, 10), 3000000) == everyDay);
      REQUIRE(PatternScanner<DecimalType>::candidateStartDays(date(9999, Dec, 1), 3000000).size() == 31);
    }
}

TEST_CASE("PatternScanner scans every start day when looking far ahead", "[PatternScanner]")
{
  PatternScanner<DecimalType> scanner(springParameters(0.75, 3000000));

  AssetScanResult result = scanner.scan("EURUSD=X", createSpringRallySeries("EURUSD=X"));

  REQUIRE(result.isScanned());
  REQUIRE(result.getNumCandidates() == 366 * 9);
  REQUIRE_FALSE(result.getPatterns().empty());
}

TEST_CASE("PatternScanner minimum years", "[PatternScanner]")
{
  REQUIRE(PatternScanner<DecimalType>::minimumYearsRequired(0) == 3);
  REQUIRE(PatternScanner<DecimalType>::minimumYearsRequired(4) == 3);
  REQUIRE(PatternScanner<DecimalType>::minimumYearsRequired(5) == 5);
  REQUIRE(PatternScanner<DecimalType>::minimumYearsRequired(10) == 5);
}

TEST_CASE("PatternScanner finds a consistent spring rally", "[PatternScanner]")
{
  std::ostringstream log;
  PatternScanner<DecimalType> scanner(springParameters(), &log);

  AssetScanResult result = scanner.scan("EURUSD=X", createSpringRallySeries("EURUSD=X"));

  REQUIRE(result.isScanned());
  REQUIRE(result.getSymbol() == "EURUSD=X");
  REQUIRE(result.getNumCandidates() == 9);
  REQUIRE(result.getNumSampleErrors() == 0);
  REQUIRE(result.getPatterns().size() == 1);

  const SeasonalPattern& pattern = result.getPatterns().front();
  REQUIRE(pattern.getAsset() == "EURUSD=X");
  REQUIRE(pattern.getDirection() == TradeDirection::LONG);
  REQUIRE(pattern.getStartIn() == 0);
  REQUIRE(pattern.getPhaseLength() == 11);
  REQUIRE(pattern.getNumYears() == 10);
  REQUIRE(pattern.getWinRate() == Approx(1.0));
  REQUIRE(pattern.getCycleWinRate() == Approx(1.0));
  REQUIRE(pattern.getLongestStreak() == 10);
  REQUIRE(pattern.isCycleSupported());
  // Mean of the 7..15 day returns: 3%, 3.5%, 4%, 4.5% then 5% five times.
  REQUIRE(pattern.getAverageReturn() == Approx((0.03 + 0.035 + 0.04 + 0.045 + 5 * 0.05) / 9.0));
  REQUIRE(pattern.getSharpeAnnualized() == Approx(0.0).margin(1e-9));

  REQUIRE(log.str().find("Found 1 seasonal patterns for EURUSD=X") != std::string::npos);
}

TEST_CASE("PatternScanner finds a short pattern in falling years", "[PatternScanner]")
{
  auto series = SyntheticSeasonalSeriesBuilder("USDJPY=X", 2010, 2019)
    .withSeasonalMove(100, 110, 95.0)
    .withYearMoveTarget(2013, 101.0)
    .build();

  PatternScanner<DecimalType> scanner(springParameters());
  AssetScanResult result = scanner.scan("USDJPY=X", series);

  REQUIRE(result.isScanned());
  REQUIRE(result.getPatterns().size() == 1);

  const SeasonalPattern& pattern = result.getPatterns().front();
  REQUIRE(pattern.getDirection() == TradeDirection::SHORT);
  REQUIRE(pattern.getWinRate() == Approx(0.9));
  REQUIRE(pattern.getLongestStreak() == 6);
  REQUIRE(pattern.getAverageReturn() > 0.0);
}

TEST_CASE("PatternScanner applies the minimum win rate", "[PatternScanner]")
{
  auto series = SyntheticSeasonalSeriesBuilder("AUDUSD=X", 2010, 2019)
    .withSeasonalMove(100, 110, 105.0)
    .withYearMoveTarget(2011, 98.0)
    .withYearMoveTarget(2014, 98.0)
    .withYearMoveTarget(2017, 98.0)
    .build();

  SECTION("70% is below 75%")
    {
      PatternScanner<DecimalType> scanner(springParameters(0.75));
      AssetScanResult result = scanner.scan("AUDUSD=X", series);
      REQUIRE(result.isScanned());
      REQUIRE(result.getPatterns().empty());
      REQUIRE(result.getNumCandidates() == 9);
    }

  SECTION("70% passes at 70%")
    {
      PatternScanner<DecimalType> scanner(springParameters(0.70));
      AssetScanResult result = scanner.scan("AUDUSD=X", series);
      REQUIRE(result.getPatterns().size() == 1);
      REQUIRE(result.getPatterns().front().getWinRate() == Approx(0.7));
    }
}

TEST_CASE("PatternScanner candidates on several days are kept apart", "[PatternScanner]")
{
  PatternScanner<DecimalType> scanner(springParameters(0.75, 2));
  AssetScanResult result = scanner.scan("EURUSD=X", createSpringRallySeries("EURUSD=X"));

  REQUIRE(result.getNumCandidates() == 27);
  REQUIRE(result.getPatterns().size() == 3);

  for (const auto& pattern : result.getPatterns())
    {
      REQUIRE(pattern.getStartIn() <= 2);
      REQUIRE(pattern.getWinRate() == Approx(1.0));
    }
}

TEST_CASE("PatternScanner skips assets it cannot scan", "[PatternScanner]")
{
  std::ostringstream log;
  PatternScanner<DecimalType> scanner(springParameters(), &log);

  SECTION("no data")
    {
      AssetScanResult result = scanner.scan("EURUSD=X", nullptr);
      REQUIRE(result.getStatus() == AssetScanStatus::MISSING_DATA);
      REQUIRE(result.getPatterns().empty());
    }

  SECTION("fewer than 200 rows after filtering")
    {
      auto series = SyntheticSeasonalSeriesBuilder("NEW", 2019, 2019)
	.withDaysOfYear(1, 150)
	.build();

      AssetScanResult result = scanner.scan("NEW", series);
      REQUIRE(result.getStatus() == AssetScanStatus::INSUFFICIENT_HISTORY);
      REQUIRE(log.str().find("Insufficient data for NEW: 150 days") != std::string::npos);
    }

  SECTION("history outside the analysis period does not count")
    {
      auto series = SyntheticSeasonalSeriesBuilder("OLD", 2000, 2009).build();

      AssetScanResult result = scanner.scan("OLD", series);
      REQUIRE(result.getStatus() == AssetScanStatus::INSUFFICIENT_HISTORY);
    }

  SECTION("more than 10% missing closes")
    {
      auto series = SyntheticSeasonalSeriesBuilder("HOLEY", 2010, 2019)
	.withSeasonalMove(100, 110, 105.0)
	.withMissingCloseEvery(5)
	.build();

      AssetScanResult result = scanner.scan("HOLEY", series);
      REQUIRE(result.getStatus() == AssetScanStatus::DATA_QUALITY);
      REQUIRE(log.str().find("Too much missing data for HOLEY") != std::string::npos);
    }

  SECTION("non daily bars")
    {
      auto weekly = std::make_shared<OHLCTimeSeries<DecimalType>>(TimeFrame::WEEKLY);
      weekly->addEntry(*createTimeSeriesEntry("20190104", "1.0", "1.0", "1.0", "1.0", "0",
					      TimeFrame::WEEKLY));
      auto series = std::make_shared<const PriceSeries<DecimalType>>("WEEKLY", weekly);

      REQUIRE_THROWS_AS(scanner.scan("WEEKLY", series), TimeSeriesException);
    }

  REQUIRE(assetScanStatusToString(AssetScanStatus::DATA_QUALITY) == "DATA_QUALITY");
}

TEST_CASE("PatternScanner tolerates a few missing closes", "[PatternScanner]")
{
  auto series = SyntheticSeasonalSeriesBuilder("EURUSD=X", 2010, 2019)
    .withSeasonalMove(100, 110, 105.0)
    .withMissingCloseEvery(20)
    .build();

  PatternScanner<DecimalType> scanner(springParameters());
  AssetScanResult result = scanner.scan("EURUSD=X", series);

  REQUIRE(result.isScanned());
  REQUIRE(result.getPatterns().size() == 1);
  REQUIRE(result.getPatterns().front().getDirection() == TradeDirection::LONG);
}
