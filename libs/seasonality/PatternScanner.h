// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_PATTERN_SCANNER_H
#define __SEASONALITY_PATTERN_SCANNER_H 1

#include <algorithm>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"
#include "TimeSeriesException.h"
#include "PriceSeries.h"
#include "ScanParameters.h"
#include "SeasonalPattern.h"
#include "WindowSampler.h"
#include "DirectionEvaluator.h"
#include "PatternMerger.h"

namespace mkc_seasonality
{
  enum class AssetScanStatus
  {
    SCANNED,
    MISSING_DATA,
    INSUFFICIENT_HISTORY,
    DATA_QUALITY,
    FAILED
  };

  inline std::string assetScanStatusToString(AssetScanStatus status)
  {
    switch (status)
      {
      case AssetScanStatus::SCANNED:
	return "SCANNED";
      case AssetScanStatus::MISSING_DATA:
	return "MISSING_DATA";
      case AssetScanStatus::INSUFFICIENT_HISTORY:
	return "INSUFFICIENT_HISTORY";
      case AssetScanStatus::DATA_QUALITY:
	return "DATA_QUALITY";
      case AssetScanStatus::FAILED:
	return "FAILED";
      }

    return "UNKNOWN";
  }

  /**
   * @brief Outcome of scanning one asset.
   *
   * Only SCANNED results carry patterns. The other statuses record why the asset
   * was skipped; none of them is an exception.
   */
  class AssetScanResult
  {
  public:
    AssetScanResult(const std::string& symbol,
		    AssetScanStatus status,
		    const std::string& message = std::string())
      : mSymbol(symbol),
	mStatus(status),
	mMessage(message),
	mPatterns(),
	mNumCandidates(0),
	mNumSampleErrors(0)
    {}

    AssetScanResult(const std::string& symbol,
		    std::vector<SeasonalPattern> patterns,
		    unsigned long numCandidates,
		    unsigned long numSampleErrors)
      : mSymbol(symbol),
	mStatus(AssetScanStatus::SCANNED),
	mMessage(),
	mPatterns(std::move(patterns)),
	mNumCandidates(numCandidates),
	mNumSampleErrors(numSampleErrors)
    {}

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    AssetScanStatus getStatus() const
    {
      return mStatus;
    }

    bool isScanned() const
    {
      return mStatus == AssetScanStatus::SCANNED;
    }

    const std::string& getMessage() const
    {
      return mMessage;
    }

    const std::vector<SeasonalPattern>& getPatterns() const
    {
      return mPatterns;
    }

    // (phase length, start day) pairs evaluated.
    unsigned long getNumCandidates() const
    {
      return mNumCandidates;
    }

    // Yearly samples that ended in an ERROR outcome.
    unsigned long getNumSampleErrors() const
    {
      return mNumSampleErrors;
    }

  private:
    std::string mSymbol;
    AssetScanStatus mStatus;
    std::string mMessage;
    std::vector<SeasonalPattern> mPatterns;
    unsigned long mNumCandidates;
    unsigned long mNumSampleErrors;
  };

  /**
   * @brief Searches one asset for seasonal patterns starting within the next
   * days-from-today days of the reference date.
   *
   * For every phase length in [min, max] and every candidate start day the
   * window is sampled in each year of the analysis period. A candidate is
   * accepted when enough years produced a sample and the winning direction's win
   * rate reaches the minimum. Accepted candidates opening on the same day are
   * merged, and the asset's list is ordered by win rate, highest first.
   */
  template <class Decimal>
  class PatternScanner
  {
  public:
    static constexpr unsigned long kMinHistoryRows = 200;
    static constexpr double kMaxMissingCloseFraction = 0.10;
    static constexpr size_t kPreferredMinYears = 5;
    static constexpr size_t kRequiredMinYears = 3;
    static constexpr double kCycleSupportWinRate = 0.5;

    explicit PatternScanner(const ScanParameters& parameters,
			    std::ostream* log = nullptr)
      : mParameters(parameters),
	mLog(log)
    {}

    const ScanParameters& getParameters() const
    {
      return mParameters;
    }

    /**
     * @brief Day of year values of the reference date through the reference date
     * plus daysFromToday, ascending and without duplicates.
     *
     * Dates past December 31 contribute their day of year in the following
     * year, so a large daysFromToday yields every day of the year. If the set is empty a window of ten days either side of the
     * reference day is used instead.
     */
    static std::vector<unsigned short> candidateStartDays(const TimeSeriesDate& referenceDate,
							  int daysFromToday)
    {
      std::set<unsigned short> days;

      // Stop once every day of a leap year has been seen, or at the last
      // date the calendar can represent.
      long lastOffset = std::min<long>(daysFromToday,
				       (TimeSeriesDate(boost::date_time::max_date_time) - referenceDate).days());

      for (long i = 0; i <= lastOffset && days.size() < 366; i++)
	days.insert(dayOfYear(referenceDate + date_duration(i)));

      if (days.empty())
	{
	  int referenceDay = dayOfYear(referenceDate);
	  int first = std::max(1, referenceDay - 10);
	  int last = std::min(365, referenceDay + daysFromToday + 9);

	  for (int day = first; day <= last; day++)
	    days.insert(static_cast<unsigned short>(day));
	}

      return std::vector<unsigned short>(days.begin(), days.end());
    }

    /**
     * @brief 5 when at least five years produced a sample, otherwise 3.
     */
    static size_t minimumYearsRequired(size_t yearsWithSamples)
    {
      return (yearsWithSamples >= kPreferredMinYears) ? kPreferredMinYears : kRequiredMinYears;
    }

    /**
     * @brief Scans a single asset.
     * @param symbol The asset symbol.
     * @param series The full history, or null when the asset has no data.
     * @throws TimeSeriesException if the series is not made of daily bars.
     */
    AssetScanResult scan(const std::string& symbol,
			 std::shared_ptr<const PriceSeries<Decimal>> series) const
    {
      if (!series)
	{
	  log("No price data for " + symbol);
	  return AssetScanResult(symbol, AssetScanStatus::MISSING_DATA, "no price data");
	}

      if (series->getTimeFrame() != TimeFrame::DAILY)
	throw TimeSeriesException("PatternScanner: " + symbol + " is not a daily series (" +
				  timeFrameToString(series->getTimeFrame()) + ")");

      PriceSeries<Decimal> filtered = series->filterByYears(mParameters.getStartYear(),
							    mParameters.getEndYear());

      if (filtered.getTotalRowCount() < kMinHistoryRows)
	{
	  std::string message = "Insufficient data for " + symbol + ": " +
	    std::to_string(filtered.getTotalRowCount()) + " days (filtered from " +
	    std::to_string(series->getTotalRowCount()) + " original)";
	  log(message);
	  return AssetScanResult(symbol, AssetScanStatus::INSUFFICIENT_HISTORY, message);
	}

      if (filtered.getMissingCloseFraction() > kMaxMissingCloseFraction)
	{
	  std::string message = "Too much missing data for " + symbol + ": " +
	    std::to_string(filtered.getNumGapDates()) + "/" +
	    std::to_string(filtered.getTotalRowCount()) + " missing closes";
	  log(message);
	  return AssetScanResult(symbol, AssetScanStatus::DATA_QUALITY, message);
	}

      WindowSampler<Decimal> sampler(filtered, mLog);
      std::vector<unsigned short> startDays = candidateStartDays(mParameters.getReferenceDate(),
								 mParameters.getDaysFromToday());

      std::vector<SeasonalPattern> patterns;
      unsigned long numCandidates = 0;
      unsigned long numSampleErrors = 0;

      for (int phaseLength = mParameters.getMinPhaseLength();
	   phaseLength <= mParameters.getMaxPhaseLength();
	   phaseLength++)
	{
	  for (unsigned short startDay : startDays)
	    {
	      numCandidates++;

	      std::optional<SeasonalPattern> pattern =
		evaluateCandidate(symbol, sampler, startDay,
				  static_cast<unsigned int>(phaseLength), numSampleErrors);
	      if (pattern)
		patterns.push_back(*pattern);
	    }
	}

      if (numSampleErrors > 0)
	log(std::to_string(numSampleErrors) + " window samples failed for " + symbol);

      std::vector<SeasonalPattern> merged = PatternMerger::merge(patterns);

      std::stable_sort(merged.begin(), merged.end(),
		       [](const SeasonalPattern& a, const SeasonalPattern& b)
		       {
			 return a.getWinRate() > b.getWinRate();
		       });

      log("Found " + std::to_string(merged.size()) + " seasonal patterns for " + symbol);

      return AssetScanResult(symbol, std::move(merged), numCandidates, numSampleErrors);
    }

    /**
     * @brief Samples and scores one (start day, phase length) candidate.
     * @return The pattern, or nothing when the candidate is not accepted.
     */
    std::optional<SeasonalPattern> evaluateCandidate(const std::string& symbol,
						     const WindowSampler<Decimal>& sampler,
						     unsigned short startDay,
						     unsigned int phaseLength,
						     unsigned long& numSampleErrors) const
    {
      std::vector<WindowSample> samples;

      for (const auto& result : sampler.sampleAllYears(startDay, phaseLength))
	{
	  if (result.isSample())
	    samples.push_back(result.getSample());
	  else if (result.isError())
	    numSampleErrors++;
	}

      if (samples.size() < minimumYearsRequired(samples.size()))
	return std::nullopt;

      DirectionEvaluation evaluation = DirectionEvaluator::evaluate(samples, phaseLength);
      const DirectionStats& best = evaluation.getWinningStats();

      if (best.getWinRate() < mParameters.getMinWinRate())
	return std::nullopt;

      unsigned int numYears = static_cast<unsigned int>(samples.size());
      bool cycleSupported = (best.getWinRate() >= kCycleSupportWinRate) &&
	(numYears >= kRequiredMinYears);

      return SeasonalPattern(symbol,
			     evaluation.getWinner(),
			     daysFromReferenceDate(startDay, mParameters.getReferenceDate()),
			     phaseLength,
			     numYears,
			     best.getWinRate(),
			     best.getMeanReturn(),
			     best.getSharpeAnnualized(),
			     best.getWinRate(),
			     cycleSupported,
			     best.getLongestStreak());
    }

  private:
    void log(const std::string& line) const
    {
      if (mLog)
	(*mLog) << "   [Seasonality] " << line << std::endl;
    }

  private:
    ScanParameters mParameters;
    std::ostream* mLog;
  };
}

#endif
