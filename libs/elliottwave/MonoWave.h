// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_MONO_WAVE_H
#define __ELLIOTT_MONO_WAVE_H 1

#include <cstddef>
#include <ostream>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_elliott
{
  using boost::posix_time::ptime;

  enum class WaveDirection
  {
    Up,
    Down
  };

  inline WaveDirection opposite(WaveDirection direction)
  {
    return (direction == WaveDirection::Up) ? WaveDirection::Down : WaveDirection::Up;
  }

  std::string toString(WaveDirection direction);

  /**
   * @class MonoWave
   * @brief A single directional price leg between two extrema.
   *
   * An up wave starts at the low of its first bar and ends at the high that
   * was reached after skipping skipCount smaller reversals; a down wave is the
   * mirror image. Instances are only produced fully resolved (see
   * MonoWaveBuilder) and are never modified afterwards.
   */
  class MonoWave
  {
  public:
    MonoWave (WaveDirection direction,
	      std::size_t idxStart,
	      std::size_t idxEnd,
	      double low,
	      std::size_t lowIdx,
	      double high,
	      std::size_t highIdx,
	      const ptime& dateStart,
	      const ptime& dateEnd,
	      unsigned int skipCount,
	      unsigned int degree = 1);

    WaveDirection getDirection() const
    {
      return mDirection;
    }

    bool isUp() const
    {
      return mDirection == WaveDirection::Up;
    }

    std::size_t getIdxStart() const { return mIdxStart; }
    std::size_t getIdxEnd() const { return mIdxEnd; }
    double getLow() const { return mLow; }
    double getHigh() const { return mHigh; }
    std::size_t getLowIdx() const { return mLowIdx; }
    std::size_t getHighIdx() const { return mHighIdx; }
    const ptime& getDateStart() const { return mDateStart; }
    const ptime& getDateEnd() const { return mDateEnd; }
    unsigned int getSkipCount() const { return mSkipCount; }
    unsigned int getDegree() const { return mDegree; }

    /**
     * @brief Price span of the wave, |high - low|.
     */
    double getLength() const;

    /**
     * @brief Number of bars between start and end.
     */
    std::size_t getDuration() const;

    /**
     * @brief Single wave extent: sqrt(duration^2 + pctChange^2) where the
     * percent change is measured relative to the low. A zero low gives a
     * zero percent change.
     *
     * For comparing two waves of different time and price scales use the
     * pairwise diagonalLength() in WaveTools.h instead.
     */
    double getDiagonalLength() const;

    // Price at the start/end of the wave in the wave's own direction
    double getStartValue() const;
    double getEndValue() const;

  private:
    WaveDirection mDirection;
    std::size_t mIdxStart;
    std::size_t mIdxEnd;
    double mLow;
    std::size_t mLowIdx;
    double mHigh;
    std::size_t mHighIdx;
    ptime mDateStart;
    ptime mDateEnd;
    unsigned int mSkipCount;
    unsigned int mDegree;
  };

  bool operator==(const MonoWave& lhs, const MonoWave& rhs);
  bool operator!=(const MonoWave& lhs, const MonoWave& rhs);

  std::ostream& operator<<(std::ostream& os, const MonoWave& wave);
} // namespace mkc_elliott

#endif // __ELLIOTT_MONO_WAVE_H
