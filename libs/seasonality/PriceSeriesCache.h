// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_PRICE_SERIES_CACHE_H
#define __SEASONALITY_PRICE_SERIES_CACHE_H 1

#include <map>
#include <memory>
#include <string>
#include "PriceSeriesSource.h"
#include "SeasonalityException.h"

namespace mkc_seasonality
{
  /**
   * @brief Loads each symbol from a source at most once and keeps the result.
   *
   * Only successful loads are cached; a symbol the source could not supply is
   * asked for again on the next request. There is no invalidation: a new cache
   * starts cold. A cache belongs to one engine and is used from one thread.
   */
  template <class Decimal>
  class PriceSeriesCache
  {
  public:
    explicit PriceSeriesCache(std::shared_ptr<PriceSeriesSource<Decimal>> source)
      : mSource(source),
	mCache()
    {
      if (!mSource)
	throw PriceSeriesSourceException("PriceSeriesCache: null price series source");
    }

    PriceSeriesCache(const PriceSeriesCache&) = delete;
    PriceSeriesCache& operator=(const PriceSeriesCache&) = delete;

    std::shared_ptr<const PriceSeries<Decimal>> getSeries(const std::string& symbol)
    {
      auto it = mCache.find(symbol);
      if (it != mCache.end())
	return it->second;

      std::shared_ptr<const PriceSeries<Decimal>> series = mSource->loadSeries(symbol);
      if (series)
	mCache.emplace(symbol, series);

      return series;
    }

    bool isCached(const std::string& symbol) const
    {
      return mCache.find(symbol) != mCache.end();
    }

    unsigned long getNumCached() const
    {
      return static_cast<unsigned long>(mCache.size());
    }

    PriceSeriesSource<Decimal>& getSource() const
    {
      return *mSource;
    }

  private:
    std::shared_ptr<PriceSeriesSource<Decimal>> mSource;
    std::map<std::string, std::shared_ptr<const PriceSeries<Decimal>>> mCache;
  };
}

#endif
