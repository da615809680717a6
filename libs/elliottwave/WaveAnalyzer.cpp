// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WaveAnalyzer.h"
#include "ElliottWaveException.h"
#include "MonoWaveBuilder.h"

namespace mkc_elliott
{
  namespace
  {
    const PriceSeries& requireBars(const PriceSeries& series)
    {
      if (series.empty())
	throw InvalidConfigurationException("WaveAnalyzer: price series " + series.getSymbol() + " is empty");

      return series;
    }
  }

  WaveAnalyzer::WaveAnalyzer(const PriceSeries& series, double zigZagThreshold)
    : mSeries(requireBars(series)),
      mZigZagThreshold(zigZagThreshold),
      mBarLocator(series.getLows(), series.getHighs()),
      mPivotLocator(detectZigZag(series, zigZagThreshold))
  {}

  void WaveAnalyzer::validateRequest(std::size_t idxStart,
				     const WaveOption& option,
				     std::size_t numWaves) const
  {
    if (idxStart >= mSeries.size())
      throw InvalidConfigurationException("WaveAnalyzer: start index " + std::to_string(idxStart) +
					  " is outside a series of " +
					  std::to_string(mSeries.size()) + " bars");

    if (option.size() != numWaves)
      throw InvalidConfigurationException("WaveAnalyzer: expected a " + std::to_string(numWaves) +
					  " slot wave option, got " + option.toString());
  }

  std::optional<WavePattern> WaveAnalyzer::buildChain(const ExtremaLocator& locator,
						      WavePatternType type,
						      WaveDirection firstDirection,
						      std::size_t idxStart,
						      const WaveOption& option) const
  {
    MonoWaveBuilder builder(mSeries, locator);

    std::vector<MonoWave> waves;
    waves.reserve(option.size());

    std::size_t nextStart = idxStart;
    WaveDirection direction = firstDirection;

    for (std::size_t slot = 0; slot < option.size(); ++slot)
      {
	auto wave = builder.build(direction, nextStart, option[slot]);
	if (!wave)
	  return std::nullopt;

	nextStart = wave->getIdxEnd();
	direction = opposite(direction);
	waves.push_back(*wave);
      }

    return WavePattern(type, waves);
  }

  std::optional<WavePattern> WaveAnalyzer::findImpulsiveWave(std::size_t idxStart,
							     const WaveOption& option) const
  {
    validateRequest(idxStart, option, IMPULSE_WAVE_COUNT);
    return buildChain(mBarLocator, WavePatternType::Impulsive, WaveDirection::Up, idxStart, option);
  }

  std::optional<WavePattern> WaveAnalyzer::findCorrectiveWave(std::size_t idxStart,
							      const WaveOption& option,
							      WaveDirection direction) const
  {
    validateRequest(idxStart, option, CORRECTIVE_WAVE_COUNT);
    return buildChain(mBarLocator, WavePatternType::Corrective, direction, idxStart, option);
  }

  std::optional<WavePattern> WaveAnalyzer::findImpulsiveWaveZigzag(std::size_t idxStart,
								   const WaveOption& option) const
  {
    validateRequest(idxStart, option, IMPULSE_WAVE_COUNT);

    for (const auto& pivot : mPivotLocator.getPivots())
      {
	if (pivot.index >= idxStart && !pivot.isHigh)
	  return buildChain(mPivotLocator, WavePatternType::Impulsive, WaveDirection::Up,
			    pivot.index, option);
      }

    return std::nullopt;
  }
} // namespace mkc_elliott
