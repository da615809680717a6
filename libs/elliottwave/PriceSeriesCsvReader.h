// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_PRICE_SERIES_CSV_READER_H
#define __ELLIOTT_PRICE_SERIES_CSV_READER_H 1

#include <string>
#include "PriceSeries.h"

namespace mkc_elliott
{
  /**
   * @brief Parses a bar date: "YYYY-MM-DD", "YYYYMMDD" or
   * "YYYY-MM-DD HH:MM[:SS]".
   * @throws PriceSeriesException if the text is not a valid date.
   */
  ptime parseBarDate(const std::string& dateStamp);

  /**
   * @class PriceSeriesCsvReader
   * @brief Loads an OHLC series from a CSV file with a header row containing
   * Date, Open, High, Low and Close. Other columns (Adj Close, Volume, ...)
   * are ignored. Rows must be in increasing date order.
   */
  class PriceSeriesCsvReader
  {
  public:
    explicit PriceSeriesCsvReader(const std::string& fileName,
				  const std::string& symbol = std::string());

    /**
     * @throws PriceSeriesException on a missing file, a missing column, an
     *         unparsable field, out of order dates or a bar with high < low.
     */
    void readFile();

    const PriceSeries& getPriceSeries() const
    {
      return mSeries;
    }

    const std::string& getFileName() const
    {
      return mFileName;
    }

  private:
    std::string mFileName;
    PriceSeries mSeries;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_PRICE_SERIES_CSV_READER_H
