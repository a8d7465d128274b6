// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_EXCEPTION_H
#define __SEASONALITY_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_seasonality
{
  /**
   * @brief Thrown when batch or scan parameters are malformed, e.g. a minimum
   * phase length greater than the maximum or a win rate outside [0, 1].
   */
  class ScanParametersException : public std::domain_error
  {
  public:
    explicit ScanParametersException(const std::string& msg)
      : std::domain_error(msg)
    {}

    ~ScanParametersException() noexcept override = default;
  };

  /**
   * @brief Thrown by a price series source that cannot be set up at all,
   * e.g. a data directory that does not exist.
   *
   * A single symbol without data is not an error; the source returns null.
   */
  class PriceSeriesSourceException : public std::runtime_error
  {
  public:
    explicit PriceSeriesSourceException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~PriceSeriesSourceException() noexcept override = default;
  };

  class AnalysisConfigurationException : public std::runtime_error
  {
  public:
    explicit AnalysisConfigurationException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~AnalysisConfigurationException() noexcept override = default;
  };
}

#endif
