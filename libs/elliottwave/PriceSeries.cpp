// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PriceSeries.h"
#include <algorithm>
#include <iterator>

namespace mkc_elliott
{
  bool operator==(const OHLCBar& lhs, const OHLCBar& rhs)
  {
    return ((lhs.getDateTime() == rhs.getDateTime()) &&
	    (lhs.getOpen() == rhs.getOpen()) &&
	    (lhs.getHigh() == rhs.getHigh()) &&
	    (lhs.getLow() == rhs.getLow()) &&
	    (lhs.getClose() == rhs.getClose()));
  }

  bool operator!=(const OHLCBar& lhs, const OHLCBar& rhs)
  {
    return !(lhs == rhs);
  }

  PriceSeries::PriceSeries (const std::string& symbol)
    : mSymbol(symbol),
      mDates(),
      mOpens(),
      mHighs(),
      mLows(),
      mCloses()
  {}

  PriceSeries::PriceSeries (const std::string& symbol, const std::vector<OHLCBar>& bars)
    : PriceSeries(symbol)
  {
    mDates.reserve(bars.size());
    mOpens.reserve(bars.size());
    mHighs.reserve(bars.size());
    mLows.reserve(bars.size());
    mCloses.reserve(bars.size());

    for (const auto& bar : bars)
      addBar(bar);
  }

  void PriceSeries::addBar (const OHLCBar& bar)
  {
    if (!mDates.empty() && bar.getDateTime() <= mDates.back())
      throw PriceSeriesException("PriceSeries::addBar: bar at " +
				 boost::posix_time::to_simple_string(bar.getDateTime()) +
				 " is not after the last bar at " +
				 boost::posix_time::to_simple_string(mDates.back()));

    if (bar.getHigh() < bar.getLow())
      throw PriceSeriesException("PriceSeries::addBar: high is less than low on " +
				 boost::posix_time::to_simple_string(bar.getDateTime()));

    mDates.push_back(bar.getDateTime());
    mOpens.push_back(bar.getOpen());
    mHighs.push_back(bar.getHigh());
    mLows.push_back(bar.getLow());
    mCloses.push_back(bar.getClose());
  }

  OHLCBar PriceSeries::getBar (std::size_t idx) const
  {
    if (idx >= size())
      throw InvalidConfigurationException("PriceSeries::getBar: index " + std::to_string(idx) +
					  " is outside a series of " + std::to_string(size()) + " bars");

    return OHLCBar(mDates[idx], mOpens[idx], mHighs[idx], mLows[idx], mCloses[idx]);
  }

  std::size_t PriceSeries::getIndexOfLowestLow() const
  {
    if (empty())
      throw InvalidConfigurationException("PriceSeries::getIndexOfLowestLow: series is empty");

    return static_cast<std::size_t>(std::distance(mLows.begin(),
						  std::min_element(mLows.begin(), mLows.end())));
  }

  std::size_t PriceSeries::getIndexOfHighestHigh() const
  {
    if (empty())
      throw InvalidConfigurationException("PriceSeries::getIndexOfHighestHigh: series is empty");

    return static_cast<std::size_t>(std::distance(mHighs.begin(),
						  std::max_element(mHighs.begin(), mHighs.end())));
  }
} // namespace mkc_elliott
