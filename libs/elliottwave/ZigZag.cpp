// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ZigZag.h"
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  namespace
  {
    // Fractional move from 'from' to 'to'; a non-positive base never qualifies
    bool movedAtLeast(double from, double to, double threshold)
    {
      if (from <= 0.0)
	return false;

      return (to / from - 1.0) >= threshold;
    }
  }

  std::vector<ZigZagPivot> detectZigZag(const PriceSeries& series, double threshold)
  {
    if (!(threshold > 0.0 && threshold < 1.0))
      throw InvalidConfigurationException("detectZigZag: threshold must be in (0, 1), got " +
					  std::to_string(threshold));

    std::vector<ZigZagPivot> pivots;
    if (series.empty())
      return pivots;

    const auto& lows = series.getLows();
    const auto& highs = series.getHighs();

    pivots.push_back(ZigZagPivot{0, lows[0], false});
    std::size_t lastPivot = 0;
    bool upTrend = true;

    for (std::size_t i = 1; i < series.size(); ++i)
      {
	if (upTrend)
	  {
	    if (lows[i] <= lows[lastPivot])
	      {
		pivots.back() = ZigZagPivot{i, lows[i], false};
		lastPivot = i;
	      }
	    else if (movedAtLeast(lows[lastPivot], highs[i], threshold))
	      {
		pivots.push_back(ZigZagPivot{i, highs[i], true});
		upTrend = false;
		lastPivot = i;
	      }
	  }
	else
	  {
	    if (highs[i] >= highs[lastPivot])
	      {
		pivots.back() = ZigZagPivot{i, highs[i], true};
		lastPivot = i;
	      }
	    else if (movedAtLeast(lows[i], highs[lastPivot], threshold))
	      {
		pivots.push_back(ZigZagPivot{i, lows[i], false});
		upTrend = true;
		lastPivot = i;
	      }
	  }
      }

    return pivots;
  }
} // namespace mkc_elliott
