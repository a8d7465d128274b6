// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SEASONALITY_NUMBER_H
#define __SEASONALITY_NUMBER_H 1

#include <string>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Conversion helpers for the decimal type used to store prices.
 *
 * Prices are held as fixed point decimals. Everything statistical (window returns,
 * win rates, risk-adjusted returns) is computed in double, so the only conversions
 * the scanner needs are string parsing on load and decimal to double on sampling.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   *
   * Seven places covers five digit FX quotes and two digit equity quotes.
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a DefaultNumber to its string representation.
   */
  inline std::string toString(const DefaultNumber& d) {
    return dec::toString(d);
  }

  /**
   * @brief Converts a DefaultNumber to a double.
   * Note: This conversion may result in a loss of precision.
   */
  inline double to_double(const DefaultNumber& d) {
    return d.getAsDouble();
  }

  /**
   * @brief Converts a string representation to a decimal type.
   * @tparam N The target decimal type (e.g., DefaultNumber).
   */
  template<class N>
  inline N fromString(const std::string& s) {
    return ::dec::fromString<N>(s);
  }

} // namespace num

#endif // __SEASONALITY_NUMBER_H
