// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExtremaLocator.h"
#include <algorithm>

namespace mkc_elliott
{
  namespace
  {
    bool isLocalHigh(const std::vector<double>& highs, std::size_t i)
    {
      return highs[i] >= highs[i - 1] && highs[i] > highs[i + 1];
    }

    bool isLocalLow(const std::vector<double>& lows, std::size_t i)
    {
      return lows[i] <= lows[i - 1] && lows[i] < lows[i + 1];
    }
  }

  std::optional<Extremum> nextHigh(const std::vector<double>& /* lows */,
				   const std::vector<double>& highs,
				   std::size_t fromIdx)
  {
    for (std::size_t i = fromIdx + 1; i + 1 < highs.size(); ++i)
      {
	if (isLocalHigh(highs, i))
	  return Extremum{i, highs[i]};
      }

    return std::nullopt;
  }

  std::optional<Extremum> nextLow(const std::vector<double>& lows,
				  const std::vector<double>& /* highs */,
				  std::size_t fromIdx)
  {
    for (std::size_t i = fromIdx + 1; i + 1 < lows.size(); ++i)
      {
	if (isLocalLow(lows, i))
	  return Extremum{i, lows[i]};
      }

    return std::nullopt;
  }

  std::optional<Extremum> nextMoreExtremeHigh(const std::vector<double>& /* lows */,
					      const std::vector<double>& highs,
					      std::size_t currentExtremeIdx,
					      double currentExtremeValue)
  {
    for (std::size_t i = currentExtremeIdx + 1; i + 1 < highs.size(); ++i)
      {
	if (highs[i] > currentExtremeValue && isLocalHigh(highs, i))
	  return Extremum{i, highs[i]};
      }

    return std::nullopt;
  }

  std::optional<Extremum> nextMoreExtremeLow(const std::vector<double>& lows,
					     const std::vector<double>& /* highs */,
					     std::size_t currentExtremeIdx,
					     double currentExtremeValue)
  {
    for (std::size_t i = currentExtremeIdx + 1; i + 1 < lows.size(); ++i)
      {
	if (lows[i] < currentExtremeValue && isLocalLow(lows, i))
	  return Extremum{i, lows[i]};
      }

    return std::nullopt;
  }

  //
  // BarExtremaLocator
  //

  BarExtremaLocator::BarExtremaLocator(const std::vector<double>& lows,
				       const std::vector<double>& highs)
    : mLows(lows),
      mHighs(highs)
  {}

  std::optional<Extremum> BarExtremaLocator::findFirst(WaveDirection direction,
						       std::size_t idxStart) const
  {
    if (direction == WaveDirection::Up)
      return nextHigh(mLows, mHighs, idxStart);

    return nextLow(mLows, mHighs, idxStart);
  }

  std::optional<Extremum> BarExtremaLocator::findMoreExtreme(WaveDirection direction,
							     std::size_t currentIdx,
							     double currentValue) const
  {
    if (direction == WaveDirection::Up)
      return nextMoreExtremeHigh(mLows, mHighs, currentIdx, currentValue);

    return nextMoreExtremeLow(mLows, mHighs, currentIdx, currentValue);
  }

  //
  // PivotExtremaLocator
  //

  PivotExtremaLocator::PivotExtremaLocator(const std::vector<ZigZagPivot>& pivots)
    : mPivots(pivots)
  {}

  std::vector<ZigZagPivot>::const_iterator
  PivotExtremaLocator::firstPivotAfter(std::size_t idx) const
  {
    return std::upper_bound(mPivots.begin(), mPivots.end(), idx,
			    [](std::size_t value, const ZigZagPivot& pivot) {
			      return value < pivot.index;
			    });
  }

  std::optional<Extremum> PivotExtremaLocator::findFirst(WaveDirection direction,
							 std::size_t idxStart) const
  {
    const bool wantHigh = (direction == WaveDirection::Up);

    for (auto it = firstPivotAfter(idxStart); it != mPivots.end(); ++it)
      {
	if (it->isHigh == wantHigh)
	  return Extremum{it->index, it->price};
      }

    return std::nullopt;
  }

  std::optional<Extremum> PivotExtremaLocator::findMoreExtreme(WaveDirection direction,
							       std::size_t currentIdx,
							       double currentValue) const
  {
    const bool wantHigh = (direction == WaveDirection::Up);

    for (auto it = firstPivotAfter(currentIdx); it != mPivots.end(); ++it)
      {
	if (it->isHigh != wantHigh)
	  continue;

	if (wantHigh ? (it->price > currentValue) : (it->price < currentValue))
	  return Extremum{it->index, it->price};
      }

    return std::nullopt;
  }
} // namespace mkc_elliott
