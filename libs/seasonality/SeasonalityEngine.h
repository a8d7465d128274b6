// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_ENGINE_H
#define __SEASONALITY_ENGINE_H 1

#include <exception>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeriesCache.h"
#include "PriceSeriesSource.h"
#include "ScanParameters.h"
#include "PatternScanner.h"
#include "PatternRanker.h"

namespace mkc_seasonality
{
  /**
   * @brief Called after each asset of a batch finishes: (completed, total, label).
   */
  using ProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

  /**
   * @brief Runs seasonal scans over a universe of assets.
   *
   * The engine owns the price series cache: each symbol is read from the
   * source once per engine, and a new engine starts with a cold cache. Assets
   * are processed one at a time on the calling thread. A failure while scanning
   * one asset is logged and recorded as FAILED; it never aborts the batch.
   */
  template <class Decimal>
  class SeasonalityEngine
  {
  public:
    explicit SeasonalityEngine(std::shared_ptr<PriceSeriesSource<Decimal>> source,
			       std::ostream* log = nullptr)
      : mCache(source),
	mLog(log)
    {}

    SeasonalityEngine(const SeasonalityEngine&) = delete;
    SeasonalityEngine& operator=(const SeasonalityEngine&) = delete;

    const PriceSeriesCache<Decimal>& getCache() const
    {
      return mCache;
    }

    /**
     * @brief Scans a single asset.
     *
     * Never throws for a problem with the asset itself; the outcome is in the
     * result's status.
     */
    AssetScanResult findSeasonalPatterns(const std::string& symbol,
					 const ScanParameters& parameters)
    {
      try
	{
	  PatternScanner<Decimal> scanner(parameters, mLog);
	  return scanner.scan(symbol, mCache.getSeries(symbol));
	}
      catch (const std::exception& e)
	{
	  if (mLog)
	    (*mLog) << "   [Seasonality] Error analyzing " << symbol << ": " << e.what() << std::endl;

	  return AssetScanResult(symbol, AssetScanStatus::FAILED, e.what());
	}
    }

    /**
     * @brief Scans every symbol and returns the deduplicated, ranked patterns.
     *
     * @param symbols Assets to scan, processed in this order.
     * @param parameters Validated scan parameters.
     * @param progress Optional, invoked after each asset.
     * @param assetResults Optional, receives one result per symbol in input order.
     * @return The ranked table, empty if no asset produced a pattern.
     */
    std::vector<SeasonalPattern> analyzeAssets(const std::vector<std::string>& symbols,
					       const ScanParameters& parameters,
					       const ProgressCallback& progress = ProgressCallback(),
					       std::vector<AssetScanResult>* assetResults = nullptr)
    {
      std::vector<SeasonalPattern> allPatterns;
      size_t numFailed = 0;

      for (size_t i = 0; i < symbols.size(); i++)
	{
	  AssetScanResult result = findSeasonalPatterns(symbols[i], parameters);

	  if (result.getStatus() == AssetScanStatus::FAILED)
	    numFailed++;

	  allPatterns.insert(allPatterns.end(),
			     result.getPatterns().begin(),
			     result.getPatterns().end());

	  if (assetResults)
	    assetResults->push_back(result);

	  if (progress)
	    progress(i + 1, symbols.size(), symbols[i]);
	}

      if (mLog)
	{
	  (*mLog) << "   [Seasonality] Deduplicating " << allPatterns.size() << " patterns from "
		  << symbols.size() << " assets";
	  if (numFailed > 0)
	    (*mLog) << " (" << numFailed << " failed)";
	  (*mLog) << std::endl;
	}

      return PatternRanker::rank(allPatterns);
    }

    /**
     * @brief Batch entry point taking the raw parameters, with today as the
     * reference date.
     * @throws ScanParametersException if the parameters are malformed.
     */
    std::vector<SeasonalPattern> analyzeAssets(const std::vector<std::string>& symbols,
					       int minPhaseLength,
					       int maxPhaseLength,
					       double minWinRate,
					       int startYear,
					       int endYear,
					       int daysFromToday,
					       const ProgressCallback& progress = ProgressCallback())
    {
      ScanParameters parameters(minPhaseLength, maxPhaseLength, minWinRate,
				startYear, endYear, daysFromToday,
				boost::gregorian::day_clock::local_day());

      return analyzeAssets(symbols, parameters, progress);
    }

  private:
    PriceSeriesCache<Decimal> mCache;
    std::ostream* mLog;
  };
}

#endif
