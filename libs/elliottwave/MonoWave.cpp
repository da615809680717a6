// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MonoWave.h"
#include <cmath>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  std::string toString(WaveDirection direction)
  {
    return (direction == WaveDirection::Up) ? std::string("Up") : std::string("Down");
  }

  MonoWave::MonoWave (WaveDirection direction,
		      std::size_t idxStart,
		      std::size_t idxEnd,
		      double low,
		      std::size_t lowIdx,
		      double high,
		      std::size_t highIdx,
		      const ptime& dateStart,
		      const ptime& dateEnd,
		      unsigned int skipCount,
		      unsigned int degree)
    : mDirection(direction),
      mIdxStart(idxStart),
      mIdxEnd(idxEnd),
      mLow(low),
      mLowIdx(lowIdx),
      mHigh(high),
      mHighIdx(highIdx),
      mDateStart(dateStart),
      mDateEnd(dateEnd),
      mSkipCount(skipCount),
      mDegree(degree)
  {
    if (idxEnd < idxStart)
      throw InvalidConfigurationException("MonoWave: end index " + std::to_string(idxEnd) +
					  " is before start index " + std::to_string(idxStart));

    if (high < low)
      throw InvalidConfigurationException("MonoWave: high is less than low");
  }

  double MonoWave::getLength() const
  {
    return std::fabs(mHigh - mLow);
  }

  std::size_t MonoWave::getDuration() const
  {
    return mIdxEnd - mIdxStart;
  }

  double MonoWave::getDiagonalLength() const
  {
    double percentChange = 0.0;
    if (mLow != 0.0)
      percentChange = ((mHigh - mLow) / mLow) * 100.0;

    const double duration = static_cast<double>(getDuration());
    return std::sqrt(duration * duration + percentChange * percentChange);
  }

  double MonoWave::getStartValue() const
  {
    return isUp() ? mLow : mHigh;
  }

  double MonoWave::getEndValue() const
  {
    return isUp() ? mHigh : mLow;
  }

  bool operator==(const MonoWave& lhs, const MonoWave& rhs)
  {
    return ((lhs.getDirection() == rhs.getDirection()) &&
	    (lhs.getIdxStart() == rhs.getIdxStart()) &&
	    (lhs.getIdxEnd() == rhs.getIdxEnd()) &&
	    (lhs.getLow() == rhs.getLow()) &&
	    (lhs.getHigh() == rhs.getHigh()));
  }

  bool operator!=(const MonoWave& lhs, const MonoWave& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const MonoWave& wave)
  {
    os << toString(wave.getDirection())
       << "[" << wave.getIdxStart() << "->" << wave.getIdxEnd() << "] "
       << wave.getStartValue() << " -> " << wave.getEndValue()
       << " skip=" << wave.getSkipCount();
    return os;
  }
} // namespace mkc_elliott
