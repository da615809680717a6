// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_RULE_H
#define __ELLIOTT_WAVE_RULE_H 1

#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "MonoWave.h"

namespace mkc_elliott
{
  constexpr double DEFAULT_XY_RATIO = 1.7;

  using TwoWavePredicate = std::function<bool(const MonoWave&, const MonoWave&)>;
  using ThreeWavePredicate = std::function<bool(const MonoWave&, const MonoWave&, const MonoWave&)>;
  using FourWavePredicate = std::function<bool(const MonoWave&, const MonoWave&,
					       const MonoWave&, const MonoWave&)>;

  // Alternative N holds a predicate over N + 2 waves
  using WavePredicate = std::variant<TwoWavePredicate, ThreeWavePredicate, FourWavePredicate>;

  /**
   * @class WaveCondition
   * @brief One named check of a rule: the wave labels it reads, the predicate
   * applied to those waves in label order and the message reported when the
   * predicate fails.
   */
  class WaveCondition
  {
  public:
    /**
     * @throws WaveRuleException if the number of labels does not match the
     *         arity of the predicate, or the predicate is empty.
     */
    WaveCondition(const std::string& id,
		  const std::vector<std::string>& waveLabels,
		  const WavePredicate& predicate,
		  const std::string& message);

    const std::string& getId() const
    {
      return mId;
    }

    const std::vector<std::string>& getWaveLabels() const
    {
      return mWaveLabels;
    }

    const std::string& getMessage() const
    {
      return mMessage;
    }

    std::size_t getArity() const
    {
      return mPredicate.index() + 2;
    }

    /**
     * @brief Applies the predicate to waves supplied in the order of
     * getWaveLabels().
     * @throws WaveRuleException if waves.size() differs from getArity().
     */
    bool evaluate(const std::vector<const MonoWave*>& waves) const;

  private:
    std::string mId;
    std::vector<std::string> mWaveLabels;
    WavePredicate mPredicate;
    std::string mMessage;
  };

  /**
   * @class WaveRule
   * @brief A named, ordered table of wave conditions describing one pattern
   * archetype.
   *
   * Conditions are evaluated in the order they were added. The x/y ratio is
   * the time-to-price weighting the archetype's predicates use when they
   * compare normalised diagonal lengths.
   */
  class WaveRule
  {
  public:
    using ConditionIterator = std::vector<WaveCondition>::const_iterator;

    explicit WaveRule(const std::string& name, double xyRatio = DEFAULT_XY_RATIO);

    void addCondition(const std::string& id,
		      const std::vector<std::string>& waveLabels,
		      const TwoWavePredicate& predicate,
		      const std::string& message);

    void addCondition(const std::string& id,
		      const std::vector<std::string>& waveLabels,
		      const ThreeWavePredicate& predicate,
		      const std::string& message);

    void addCondition(const std::string& id,
		      const std::vector<std::string>& waveLabels,
		      const FourWavePredicate& predicate,
		      const std::string& message);

    const std::string& getName() const
    {
      return mName;
    }

    double getXYRatio() const
    {
      return mXYRatio;
    }

    std::size_t getNumConditions() const
    {
      return mConditions.size();
    }

    ConditionIterator beginConditions() const
    {
      return mConditions.begin();
    }

    ConditionIterator endConditions() const
    {
      return mConditions.end();
    }

    // Union of the labels read by every condition
    std::set<std::string> getRequiredLabels() const;

  private:
    void appendCondition(WaveCondition&& condition);

    std::string mName;
    double mXYRatio;
    std::vector<WaveCondition> mConditions;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_RULE_H
