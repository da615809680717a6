// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WaveTools.h"
#include <algorithm>
#include <cmath>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  FibonacciMode fibonacciModeFromString(const std::string& mode)
  {
    if (mode == "low_to_high")
      return FibonacciMode::LowToHigh;

    if (mode == "high_to_low")
      return FibonacciMode::HighToLow;

    throw InvalidArgumentException("Invalid Fibonacci mode '" + mode +
				   "'. Use 'low_to_high' or 'high_to_low'.");
  }

  double fibonacciLevel(double low, double high, double ratio, FibonacciMode mode)
  {
    switch (mode)
      {
      case FibonacciMode::LowToHigh:
	return low + (high - low) * ratio;
      case FibonacciMode::HighToLow:
	return high - (high - low) * ratio;
      }

    throw InvalidArgumentException("fibonacciLevel: unknown FibonacciMode");
  }

  double fibonacciLevel(double low, double high, double ratio, const std::string& mode)
  {
    return fibonacciLevel(low, high, ratio, fibonacciModeFromString(mode));
  }

  double slope(double x1, double x2, double y1, double y2)
  {
    const double deltaX = x2 - x1;
    if (deltaX == 0.0)
      return 0.0;

    return (y2 - y1) / deltaX;
  }

  namespace
  {
    double normalise(double value, double maxValue)
    {
      return (maxValue == 0.0) ? 0.0 : value / maxValue;
    }
  }

  std::pair<double, double> diagonalLength(double durationA, double spanA,
					   double durationB, double spanB,
					   double xyRatio)
  {
    const double maxDuration = std::max(durationA, durationB);
    const double maxSpan = std::max(spanA, spanB);

    const double widthA = normalise(durationA, maxDuration) * xyRatio;
    const double widthB = normalise(durationB, maxDuration) * xyRatio;
    const double heightA = normalise(spanA, maxSpan);
    const double heightB = normalise(spanB, maxSpan);

    return std::make_pair(std::sqrt(widthA * widthA + heightA * heightA),
			  std::sqrt(widthB * widthB + heightB * heightB));
  }

  std::pair<double, double> diagonalLength(const MonoWave& waveA,
					   const MonoWave& waveB,
					   double xyRatio)
  {
    return diagonalLength(static_cast<double>(waveA.getDuration()), waveA.getLength(),
			  static_cast<double>(waveB.getDuration()), waveB.getLength(),
			  xyRatio);
  }

  bool isLongerThan(const MonoWave& waveA, const MonoWave& waveB, double xyRatio)
  {
    const auto lengths = diagonalLength(waveA, waveB, xyRatio);
    return lengths.first > lengths.second;
  }

  double diagonalRatio(const MonoWave& waveA, const MonoWave& waveB, double xyRatio)
  {
    const auto lengths = diagonalLength(waveA, waveB, xyRatio);
    if (lengths.second == 0.0)
      return 0.0;

    return lengths.first / lengths.second;
  }
} // namespace mkc_elliott
