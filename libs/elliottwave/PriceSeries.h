// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_PRICE_SERIES_H
#define __ELLIOTT_PRICE_SERIES_H 1

#include <cstddef>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  using boost::posix_time::ptime;

  //
  // class OHLCBar
  //
  // One row of the source series. The search core only reads bars by
  // position, so bars are plain values.
  //
  class OHLCBar
  {
  public:
    OHLCBar (const ptime& dateTime, double open, double high, double low, double close)
      : mDateTime(dateTime),
	mOpen(open),
	mHigh(high),
	mLow(low),
	mClose(close)
    {}

    OHLCBar (const boost::gregorian::date& date, double open, double high, double low, double close)
      : OHLCBar(ptime(date), open, high, low, close)
    {}

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    boost::gregorian::date getDate() const
    {
      return mDateTime.date();
    }

    double getOpen() const { return mOpen; }
    double getHigh() const { return mHigh; }
    double getLow() const { return mLow; }
    double getClose() const { return mClose; }

  private:
    ptime mDateTime;
    double mOpen;
    double mHigh;
    double mLow;
    double mClose;
  };

  bool operator==(const OHLCBar& lhs, const OHLCBar& rhs);
  bool operator!=(const OHLCBar& lhs, const OHLCBar& rhs);

  //
  // class PriceSeries
  //
  // Time ordered OHLC table kept as parallel arrays so the extrema search
  // can scan lows and highs directly.
  //
  class PriceSeries
  {
  public:
    explicit PriceSeries (const std::string& symbol = std::string());

    PriceSeries (const std::string& symbol, const std::vector<OHLCBar>& bars);

    /**
     * @brief Appends a bar to the end of the series.
     * @throws PriceSeriesException if the bar's date is not strictly after the
     *         last bar's date or if its high is below its low.
     */
    void addBar (const OHLCBar& bar);

    OHLCBar getBar (std::size_t idx) const;

    std::size_t size() const
    {
      return mDates.size();
    }

    bool empty() const
    {
      return mDates.empty();
    }

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const std::vector<ptime>& getDates() const { return mDates; }
    const std::vector<double>& getOpens() const { return mOpens; }
    const std::vector<double>& getHighs() const { return mHighs; }
    const std::vector<double>& getLows() const { return mLows; }
    const std::vector<double>& getCloses() const { return mCloses; }

    /**
     * @brief Position of the lowest low, the conventional start of an
     * upward impulse search. Ties resolve to the earliest bar.
     * @throws InvalidConfigurationException on an empty series.
     */
    std::size_t getIndexOfLowestLow() const;

    /**
     * @brief Position of the highest high, ties resolve to the earliest bar.
     * @throws InvalidConfigurationException on an empty series.
     */
    std::size_t getIndexOfHighestHigh() const;

  private:
    std::string mSymbol;
    std::vector<ptime> mDates;
    std::vector<double> mOpens;
    std::vector<double> mHighs;
    std::vector<double> mLows;
    std::vector<double> mCloses;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_PRICE_SERIES_H
