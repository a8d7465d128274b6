#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "DirectionEvaluator.h"
#include "SampleStatistics.h"

using namespace mkc_seasonality;
using Catch::Approx;

namespace
{
  std::vector<WindowSample> makeSamples(int firstYear, const std::vector<double>& returns)
  {
    std::vector<WindowSample> samples;
    for (size_t i = 0; i < returns.size(); i++)
      samples.push_back(WindowSample(firstYear + static_cast<int>(i), returns[i]));
    return samples;
  }
}

TEST_CASE("SampleStatistics", "[SampleStatistics]")
{
  std::vector<double> data = {0.01, 0.02, 0.03};

  REQUIRE(SampleStatistics::computeMean(data) == Approx(0.02));
  REQUIRE(SampleStatistics::computeVariance(data, 0.02) == Approx(0.0001));
  REQUIRE(SampleStatistics::computeStdDev(data, 0.02) == Approx(0.01));
  REQUIRE(SampleStatistics::computeWinRate({0.01, 0.0, -0.01, 0.02}) == Approx(0.5));
  REQUIRE(SampleStatistics::computeLongestWinningStreak({1.0, 1.0, -1.0, 1.0, 1.0, 1.0, 0.0, 1.0}) == 3);

  REQUIRE(SampleStatistics::computeMean({}) == 0.0);
  REQUIRE(SampleStatistics::computeVariance({0.5}, 0.5) == 0.0);
  REQUIRE(SampleStatistics::computeWinRate({}) == 0.0);
  REQUIRE(SampleStatistics::computeLongestWinningStreak({}) == 0);
}

TEST_CASE("DirectionEvaluator picks long for rising years", "[DirectionEvaluator]")
{
  DirectionEvaluation evaluation =
    DirectionEvaluator::evaluate(makeSamples(2010, {0.01, 0.02, 0.03, 0.02, 0.01}), 10);

  REQUIRE(evaluation.getWinner() == TradeDirection::LONG);
  REQUIRE(evaluation.getLongStats().getWinRate() == Approx(1.0));
  REQUIRE(evaluation.getShortStats().getWinRate() == Approx(0.0));
  REQUIRE(evaluation.getWinningStats().getMeanReturn() == Approx(0.018));
  REQUIRE(evaluation.getShortStats().getMeanReturn() == Approx(-0.018));
  REQUIRE(evaluation.getWinningStats().getLongestStreak() == 5);
}

TEST_CASE("DirectionEvaluator picks short for falling years", "[DirectionEvaluator]")
{
  DirectionEvaluation evaluation =
    DirectionEvaluator::evaluate(makeSamples(2010, {-0.02, -0.01, 0.01, -0.03, -0.02}), 10);

  REQUIRE(evaluation.getWinner() == TradeDirection::SHORT);
  REQUIRE(evaluation.getWinningStats().getWinRate() == Approx(0.8));
  REQUIRE(evaluation.getWinningStats().getMeanReturn() == Approx(0.014));
  REQUIRE(evaluation.getWinningStats().getLongestStreak() == 2);
}

TEST_CASE("DirectionEvaluator flat years count as a loss both ways", "[DirectionEvaluator]")
{
  DirectionEvaluation evaluation =
    DirectionEvaluator::evaluate(makeSamples(2010, {0.01, 0.0, -0.01, 0.02}), 10);

  REQUIRE(evaluation.getLongStats().getWinRate() == Approx(0.5));
  REQUIRE(evaluation.getShortStats().getWinRate() == Approx(0.25));
  REQUIRE(evaluation.getLongStats().getWinRate() + evaluation.getShortStats().getWinRate() < 1.0);
  REQUIRE(evaluation.getWinner() == TradeDirection::LONG);
  REQUIRE(evaluation.getWinningStats().getMeanReturn() == Approx(0.005));
}

TEST_CASE("DirectionEvaluator tie breaks", "[DirectionEvaluator]")
{
  SECTION("equal win rates go to the higher mean")
    {
      DirectionEvaluation evaluation =
	DirectionEvaluator::evaluate(makeSamples(2010, {0.01, -0.05, 0.01, -0.05}), 10);
      REQUIRE(evaluation.getWinner() == TradeDirection::SHORT);
    }

  SECTION("equal win rates and means go to long")
    {
      DirectionEvaluation evaluation =
	DirectionEvaluator::evaluate(makeSamples(2010, {0.02, -0.02, 0.02, -0.02}), 10);
      REQUIRE(evaluation.getWinner() == TradeDirection::LONG);
    }

  SECTION("all zero returns go to long with a zero win rate")
    {
      DirectionEvaluation evaluation =
	DirectionEvaluator::evaluate(makeSamples(2010, {0.0, 0.0, 0.0}), 10);
      REQUIRE(evaluation.getWinner() == TradeDirection::LONG);
      REQUIRE(evaluation.getWinningStats().getWinRate() == 0.0);
    }
}

TEST_CASE("DirectionEvaluator annualized sharpe", "[DirectionEvaluator]")
{
  SECTION("mean over sample deviation scaled by sqrt(252 / L)")
    {
      DirectionStats stats = DirectionEvaluator::computeStats({0.01, 0.02, 0.03}, 21);
      REQUIRE(stats.getSharpeAnnualized() == Approx(2.0 * std::sqrt(12.0)));
    }

  SECTION("clamped to ten")
    {
      DirectionStats stats = DirectionEvaluator::computeStats({0.01, 0.02, 0.03}, 10);
      REQUIRE(stats.getSharpeAnnualized() == Approx(10.0));

      DirectionStats shortStats = DirectionEvaluator::computeStats({-0.01, -0.02, -0.03}, 10);
      REQUIRE(shortStats.getSharpeAnnualized() == Approx(-10.0));
    }

  SECTION("zero deviation gives zero")
    {
      DirectionStats stats = DirectionEvaluator::computeStats({0.05, 0.05, 0.05}, 10);
      REQUIRE(stats.getSharpeAnnualized() == 0.0);
    }
}

TEST_CASE("DirectionEvaluator orders samples by year before counting streaks", "[DirectionEvaluator]")
{
  std::vector<WindowSample> samples;
  samples.push_back(WindowSample(2015, 0.01));
  samples.push_back(WindowSample(2012, -0.01));
  samples.push_back(WindowSample(2013, 0.01));
  samples.push_back(WindowSample(2014, 0.01));
  samples.push_back(WindowSample(2010, 0.01));
  samples.push_back(WindowSample(2011, 0.01));

  DirectionEvaluation evaluation = DirectionEvaluator::evaluate(samples, 10);

  REQUIRE(evaluation.getWinner() == TradeDirection::LONG);
  REQUIRE(evaluation.getLongStats().getLongestStreak() == 3);
  REQUIRE(evaluation.getShortStats().getLongestStreak() == 1);
}
