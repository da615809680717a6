// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_EXTREMA_LOCATOR_H
#define __ELLIOTT_EXTREMA_LOCATOR_H 1

#include <cstddef>
#include <optional>
#include <vector>
#include "MonoWave.h"
#include "ZigZag.h"

namespace mkc_elliott
{
  struct Extremum
  {
    std::size_t index;
    double value;
  };

  /**
   * @brief First local maximum strictly after fromIdx.
   *
   * Bar i is a local maximum when highs[i] >= highs[i-1] and
   * highs[i] > highs[i+1]. The last bar has no successor and can never
   * confirm, so a series that is still rising at its end yields nullopt.
   */
  std::optional<Extremum> nextHigh(const std::vector<double>& lows,
				   const std::vector<double>& highs,
				   std::size_t fromIdx);

  /**
   * @brief First local minimum strictly after fromIdx (mirror of nextHigh).
   */
  std::optional<Extremum> nextLow(const std::vector<double>& lows,
				  const std::vector<double>& highs,
				  std::size_t fromIdx);

  /**
   * @brief First local maximum after currentExtremeIdx whose high is strictly
   * greater than currentExtremeValue.
   */
  std::optional<Extremum> nextMoreExtremeHigh(const std::vector<double>& lows,
					      const std::vector<double>& highs,
					      std::size_t currentExtremeIdx,
					      double currentExtremeValue);

  /**
   * @brief First local minimum after currentExtremeIdx whose low is strictly
   * less than currentExtremeValue.
   */
  std::optional<Extremum> nextMoreExtremeLow(const std::vector<double>& lows,
					     const std::vector<double>& highs,
					     std::size_t currentExtremeIdx,
					     double currentExtremeValue);

  /**
   * @class ExtremaLocator
   * @brief Source of wave end points for MonoWaveBuilder.
   *
   * findFirst returns the end of a wave that skips nothing; findMoreExtreme
   * returns the next candidate strictly beyond the current one. Up waves look
   * for highs, down waves for lows.
   */
  class ExtremaLocator
  {
  public:
    virtual ~ExtremaLocator() = default;

    virtual std::optional<Extremum> findFirst(WaveDirection direction,
					      std::size_t idxStart) const = 0;

    virtual std::optional<Extremum> findMoreExtreme(WaveDirection direction,
						    std::size_t currentIdx,
						    double currentValue) const = 0;
  };

  // Local extrema computed from the raw bars
  class BarExtremaLocator : public ExtremaLocator
  {
  public:
    BarExtremaLocator(const std::vector<double>& lows, const std::vector<double>& highs);

    std::optional<Extremum> findFirst(WaveDirection direction,
				      std::size_t idxStart) const override;

    std::optional<Extremum> findMoreExtreme(WaveDirection direction,
					    std::size_t currentIdx,
					    double currentValue) const override;

  private:
    const std::vector<double>& mLows;
    const std::vector<double>& mHighs;
  };

  // Extrema restricted to a pre-extracted zig-zag pivot sequence
  class PivotExtremaLocator : public ExtremaLocator
  {
  public:
    explicit PivotExtremaLocator(const std::vector<ZigZagPivot>& pivots);

    std::optional<Extremum> findFirst(WaveDirection direction,
				      std::size_t idxStart) const override;

    std::optional<Extremum> findMoreExtreme(WaveDirection direction,
					    std::size_t currentIdx,
					    double currentValue) const override;

    const std::vector<ZigZagPivot>& getPivots() const
    {
      return mPivots;
    }

  private:
    std::vector<ZigZagPivot>::const_iterator firstPivotAfter(std::size_t idx) const;

    std::vector<ZigZagPivot> mPivots;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_EXTREMA_LOCATOR_H
