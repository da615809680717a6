// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MonoWaveBuilder.h"
#include <algorithm>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  MonoWaveBuilder::MonoWaveBuilder(const PriceSeries& series, const ExtremaLocator& locator)
    : mSeries(series),
      mLocator(locator)
  {}

  bool MonoWaveBuilder::violatesOrigin(WaveDirection direction,
				       std::size_t idxStart,
				       std::size_t idxCandidate) const
  {
    if (direction == WaveDirection::Up)
      {
	const auto& lows = mSeries.getLows();
	const double lowAtStart = lows[idxStart];
	return std::any_of(lows.begin() + idxStart, lows.begin() + idxCandidate,
			   [lowAtStart](double low) { return low < lowAtStart; });
      }

    const auto& highs = mSeries.getHighs();
    const double highAtStart = highs[idxStart];
    return std::any_of(highs.begin() + idxStart, highs.begin() + idxCandidate,
		       [highAtStart](double high) { return high > highAtStart; });
  }

  std::optional<MonoWave> MonoWaveBuilder::build(WaveDirection direction,
						 std::size_t idxStart,
						 unsigned int skipCount) const
  {
    if (idxStart >= mSeries.size())
      throw InvalidConfigurationException("MonoWaveBuilder: start index " + std::to_string(idxStart) +
					  " is outside a series of " +
					  std::to_string(mSeries.size()) + " bars");

    auto end = mLocator.findFirst(direction, idxStart);
    if (!end)
      return std::nullopt;

    for (unsigned int skip = 0; skip < skipCount; ++skip)
      {
	auto candidate = mLocator.findMoreExtreme(direction, end->index, end->value);
	if (!candidate)
	  return std::nullopt;

	if (violatesOrigin(direction, idxStart, candidate->index))
	  return std::nullopt;

	end = candidate;
      }

    const auto& dates = mSeries.getDates();

    // A wave that ends behind its own start is not a wave
    if (direction == WaveDirection::Up && end->value < mSeries.getLows()[idxStart])
      return std::nullopt;

    if (direction == WaveDirection::Down && end->value > mSeries.getHighs()[idxStart])
      return std::nullopt;

    if (direction == WaveDirection::Up)
      return MonoWave(direction,
		      idxStart, end->index,
		      mSeries.getLows()[idxStart], idxStart,
		      end->value, end->index,
		      dates[idxStart], dates[end->index],
		      skipCount);

    return MonoWave(direction,
		    idxStart, end->index,
		    end->value, end->index,
		    mSeries.getHighs()[idxStart], idxStart,
		    dates[idxStart], dates[end->index],
		    skipCount);
  }
} // namespace mkc_elliott
