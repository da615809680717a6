// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_TOOLS_H
#define __ELLIOTT_WAVE_TOOLS_H 1

#include <cstddef>
#include <string>
#include <utility>
#include "MonoWave.h"

/**
 * @file WaveTools.h
 * @brief Geometry helpers shared by the rule tables: Fibonacci levels,
 * trendline slopes and the pairwise normalised diagonal length.
 */
namespace mkc_elliott
{
  enum class FibonacciMode
  {
    LowToHigh,
    HighToLow
  };

  /**
   * @brief Parses "low_to_high" or "high_to_low".
   * @throws InvalidArgumentException for any other string.
   */
  FibonacciMode fibonacciModeFromString(const std::string& mode);

  /**
   * @brief Fibonacci level between low and high.
   *
   * LowToHigh measures up from the low, HighToLow measures down from the
   * high, so levelLowToHigh(r) + levelHighToLow(r) == low + high.
   */
  double fibonacciLevel(double low, double high, double ratio, FibonacciMode mode);

  double fibonacciLevel(double low, double high, double ratio, const std::string& mode);

  /**
   * @brief Slope of the line through (x1, y1) and (x2, y2), 0 for a vertical line.
   */
  double slope(double x1, double x2, double y1, double y2);

  /**
   * @brief Normalised diagonal lengths of two legs given their durations
   * and price spans.
   *
   * Durations are divided by the larger of the two durations and scaled by
   * xyRatio, spans are divided by the larger of the two spans. Each leg's
   * score is sqrt(width^2 + height^2). The result is relative to the pair: the
   * same leg scores differently against a different partner.
   */
  std::pair<double, double> diagonalLength(double durationA, double spanA,
					   double durationB, double spanB,
					   double xyRatio);

  std::pair<double, double> diagonalLength(const MonoWave& waveA,
					   const MonoWave& waveB,
					   double xyRatio);

  /**
   * @brief True when waveA's normalised diagonal length exceeds waveB's.
   */
  bool isLongerThan(const MonoWave& waveA, const MonoWave& waveB, double xyRatio);

  /**
   * @brief waveA's normalised diagonal length divided by waveB's, 0 when
   * waveB scores 0.
   */
  double diagonalRatio(const MonoWave& waveA, const MonoWave& waveB, double xyRatio);
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_TOOLS_H
