// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_PATTERN_H
#define __ELLIOTT_WAVE_PATTERN_H 1

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "MonoWave.h"
#include "WaveRule.h"

namespace mkc_elliott
{
  enum class WavePatternType
  {
    Impulsive,
    Corrective
  };

  std::string toString(WavePatternType type);

  // Rule key of the wave at position n (0 based): "wave1", "wave2", ...
  std::string waveKey(std::size_t position);

  /**
   * @class WavePattern
   * @brief A chain of contiguous monowaves forming a 5-wave impulsive or
   * 3-wave corrective candidate.
   *
   * Waves are keyed "wave1".."waveN" for rule evaluation in both shapes; the
   * corrective shape is displayed as A, B, C. Identity (equality and hashing)
   * depends only on the start and end of the pattern and on the
   * (low, high, idx_start, idx_end) of every wave, so two candidates that were
   * reached through different skip tuples compare equal when they land on the
   * same extrema.
   */
  class WavePattern
  {
  public:
    /**
     * @throws InvalidConfigurationException if the wave count does not match
     *         the pattern type or the waves are not contiguous.
     */
    WavePattern(WavePatternType type, const std::vector<MonoWave>& waves);

    WavePatternType getType() const
    {
      return mType;
    }

    bool isImpulsive() const
    {
      return mType == WavePatternType::Impulsive;
    }

    std::size_t getNumWaves() const
    {
      return mWaves.size();
    }

    const std::vector<MonoWave>& getWaves() const
    {
      return mWaves;
    }

    /**
     * @brief Looks up a wave by its rule key ("wave1".."waveN").
     * @throws WaveRuleException if the pattern has no such wave.
     */
    const MonoWave& getWave(const std::string& key) const;

    bool hasWave(const std::string& key) const;

    // Rule keys in order
    std::vector<std::string> getWaveKeys() const;

    std::size_t getIdxStart() const
    {
      return mWaves.front().getIdxStart();
    }

    std::size_t getIdxEnd() const
    {
      return mWaves.back().getIdxEnd();
    }

    // Sum of the per-wave skip counts that produced this chain
    unsigned long getTotalSkips() const;

    // Rendering triple. One point per wave boundary: the start of the first
    // wave followed by the end of every wave.
    std::vector<ptime> dates() const;
    std::vector<double> values() const;
    std::vector<std::string> labels() const;

    /**
     * @brief Evaluates the rule's conditions in table order.
     *
     * Returns true if every condition holds. On the first condition that
     * fails, its message is stored as the violation and false is returned;
     * later conditions are not evaluated. A passing check clears any earlier
     * violation.
     *
     * @throws WaveRuleException if the rule reads a wave this pattern does not
     *         have.
     */
    bool checkRule(const WaveRule& rule);

    const std::optional<std::string>& getViolation() const
    {
      return mViolation;
    }

    /**
     * @brief Collapses the pattern into a single wave one degree higher,
     * running from the start of the first wave to the end of the last.
     * @throws InvalidConfigurationException if the pattern ends behind its
     *         start relative to its leading direction.
     */
    MonoWave toHigherDegreeWave() const;

  private:
    WavePatternType mType;
    std::vector<MonoWave> mWaves;
    std::optional<std::string> mViolation;
  };

  bool operator==(const WavePattern& lhs, const WavePattern& rhs);
  bool operator!=(const WavePattern& lhs, const WavePattern& rhs);
  std::ostream& operator<<(std::ostream& os, const WavePattern& pattern);

  struct WavePatternHash
  {
    std::size_t operator()(const WavePattern& pattern) const;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_PATTERN_H
