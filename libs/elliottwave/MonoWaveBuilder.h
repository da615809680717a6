// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_MONO_WAVE_BUILDER_H
#define __ELLIOTT_MONO_WAVE_BUILDER_H 1

#include <cstddef>
#include <optional>
#include "ExtremaLocator.h"
#include "MonoWave.h"
#include "PriceSeries.h"

namespace mkc_elliott
{
  /**
   * @class MonoWaveBuilder
   * @brief Builds fully resolved MonoWaves or reports that none exists.
   *
   * An up wave starts at lows[idxStart] and ends at the first local high
   * after the start. Each skip replaces the end with the next strictly
   * higher high; the skip is only accepted if no low in
   * [idxStart, newHighIdx) undercuts the starting low, otherwise the wave
   * fails. A skip with no higher high left also fails the wave. Down waves
   * are the mirror image.
   *
   * The builder keeps references to the series and locator; both must
   * outlive it.
   */
  class MonoWaveBuilder
  {
  public:
    MonoWaveBuilder(const PriceSeries& series, const ExtremaLocator& locator);

    /**
     * @return The wave, or std::nullopt when the skip configuration is not
     *         satisfiable from idxStart.
     * @throws InvalidConfigurationException if idxStart is outside the series.
     */
    std::optional<MonoWave> build(WaveDirection direction,
				  std::size_t idxStart,
				  unsigned int skipCount) const;

    std::optional<MonoWave> buildUp(std::size_t idxStart, unsigned int skipCount) const
    {
      return build(WaveDirection::Up, idxStart, skipCount);
    }

    std::optional<MonoWave> buildDown(std::size_t idxStart, unsigned int skipCount) const
    {
      return build(WaveDirection::Down, idxStart, skipCount);
    }

  private:
    bool violatesOrigin(WaveDirection direction,
			std::size_t idxStart,
			std::size_t idxCandidate) const;

    const PriceSeries& mSeries;
    const ExtremaLocator& mLocator;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_MONO_WAVE_BUILDER_H
