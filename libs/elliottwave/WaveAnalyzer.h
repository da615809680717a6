// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_ANALYZER_H
#define __ELLIOTT_WAVE_ANALYZER_H 1

#include <cstddef>
#include <optional>
#include <vector>
#include "ExtremaLocator.h"
#include "MonoWave.h"
#include "PriceSeries.h"
#include "WaveOptions.h"
#include "WavePattern.h"
#include "ZigZag.h"

namespace mkc_elliott
{
  constexpr double DEFAULT_ZIGZAG_THRESHOLD = 0.05;

  /**
   * @class WaveAnalyzer
   * @brief Chains monowaves over a price series into impulsive and
   * corrective candidates, one skip tuple at a time.
   *
   * Each wave starts where the previous one ended and alternates direction.
   * A link that cannot be resolved for its skip count fails the whole chain;
   * partial chains are never returned.
   *
   * The analyzer only reads the series, so a single instance can be shared by
   * concurrent callers. The series must outlive the analyzer.
   */
  class WaveAnalyzer
  {
  public:
    /**
     * @throws InvalidConfigurationException if the series is empty or the
     *         zig-zag threshold is not in (0, 1).
     */
    explicit WaveAnalyzer(const PriceSeries& series,
			  double zigZagThreshold = DEFAULT_ZIGZAG_THRESHOLD);

    WaveAnalyzer(const WaveAnalyzer&) = delete;
    WaveAnalyzer& operator=(const WaveAnalyzer&) = delete;

    /**
     * @brief Up, down, up, down, up from idxStart.
     * @throws InvalidConfigurationException if idxStart is outside the series
     *         or the option does not have five slots.
     */
    std::optional<WavePattern> findImpulsiveWave(std::size_t idxStart,
						 const WaveOption& option) const;

    /**
     * @brief Three alternating waves from idxStart, wave A running in
     * @p direction (down by default).
     * @throws InvalidConfigurationException if idxStart is outside the series
     *         or the option does not have three slots.
     */
    std::optional<WavePattern> findCorrectiveWave(std::size_t idxStart,
						  const WaveOption& option,
						  WaveDirection direction = WaveDirection::Down) const;

    /**
     * @brief Same chain as findImpulsiveWave() but walking the zig-zag pivots
     * instead of bar level extrema. The chain starts at the first low pivot
     * at or after idxStart.
     */
    std::optional<WavePattern> findImpulsiveWaveZigzag(std::size_t idxStart,
						       const WaveOption& option) const;

    const std::vector<ZigZagPivot>& getPivots() const
    {
      return mPivotLocator.getPivots();
    }

    double getZigZagThreshold() const
    {
      return mZigZagThreshold;
    }

    const PriceSeries& getSeries() const
    {
      return mSeries;
    }

    // Bar holding the lowest low of the series, the usual anchor of a search
    std::size_t getDefaultStartIndex() const
    {
      return mSeries.getIndexOfLowestLow();
    }

  private:
    void validateRequest(std::size_t idxStart, const WaveOption& option, std::size_t numWaves) const;

    std::optional<WavePattern> buildChain(const ExtremaLocator& locator,
					  WavePatternType type,
					  WaveDirection firstDirection,
					  std::size_t idxStart,
					  const WaveOption& option) const;

    const PriceSeries& mSeries;
    double mZigZagThreshold;
    BarExtremaLocator mBarLocator;
    PivotExtremaLocator mPivotLocator;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_ANALYZER_H
