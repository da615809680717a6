// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WaveRule.h"
#include <algorithm>
#include <utility>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  namespace
  {
    bool isEmptyPredicate(const WavePredicate& predicate)
    {
      return std::visit([](const auto& fn) { return !static_cast<bool>(fn); }, predicate);
    }
  }

  WaveCondition::WaveCondition(const std::string& id,
			       const std::vector<std::string>& waveLabels,
			       const WavePredicate& predicate,
			       const std::string& message)
    : mId(id),
      mWaveLabels(waveLabels),
      mPredicate(predicate),
      mMessage(message)
  {
    if (isEmptyPredicate(mPredicate))
      throw WaveRuleException("WaveCondition " + mId + ": predicate is empty");

    if (mWaveLabels.size() != getArity())
      throw WaveRuleException("WaveCondition " + mId + ": predicate takes " +
			      std::to_string(getArity()) + " waves but " +
			      std::to_string(mWaveLabels.size()) + " labels were given");
  }

  bool WaveCondition::evaluate(const std::vector<const MonoWave*>& waves) const
  {
    if (waves.size() != getArity())
      throw WaveRuleException("WaveCondition " + mId + ": expected " +
			      std::to_string(getArity()) + " waves, got " +
			      std::to_string(waves.size()));

    switch (mPredicate.index())
      {
      case 0:
	return std::get<TwoWavePredicate>(mPredicate)(*waves[0], *waves[1]);
      case 1:
	return std::get<ThreeWavePredicate>(mPredicate)(*waves[0], *waves[1], *waves[2]);
      default:
	return std::get<FourWavePredicate>(mPredicate)(*waves[0], *waves[1], *waves[2], *waves[3]);
      }
  }

  WaveRule::WaveRule(const std::string& name, double xyRatio)
    : mName(name),
      mXYRatio(xyRatio),
      mConditions()
  {
    if (!(xyRatio > 0.0))
      throw InvalidConfigurationException("WaveRule " + name + ": x/y ratio must be positive, got " +
					  std::to_string(xyRatio));
  }

  void WaveRule::addCondition(const std::string& id,
			      const std::vector<std::string>& waveLabels,
			      const TwoWavePredicate& predicate,
			      const std::string& message)
  {
    appendCondition(WaveCondition(id, waveLabels, WavePredicate(predicate), message));
  }

  void WaveRule::addCondition(const std::string& id,
			      const std::vector<std::string>& waveLabels,
			      const ThreeWavePredicate& predicate,
			      const std::string& message)
  {
    appendCondition(WaveCondition(id, waveLabels, WavePredicate(predicate), message));
  }

  void WaveRule::addCondition(const std::string& id,
			      const std::vector<std::string>& waveLabels,
			      const FourWavePredicate& predicate,
			      const std::string& message)
  {
    appendCondition(WaveCondition(id, waveLabels, WavePredicate(predicate), message));
  }

  void WaveRule::appendCondition(WaveCondition&& condition)
  {
    auto sameId = [&condition](const WaveCondition& existing) {
      return existing.getId() == condition.getId();
    };

    if (std::any_of(mConditions.begin(), mConditions.end(), sameId))
      throw WaveRuleException("WaveRule " + mName + ": duplicate condition id " + condition.getId());

    mConditions.push_back(std::move(condition));
  }

  std::set<std::string> WaveRule::getRequiredLabels() const
  {
    std::set<std::string> labels;
    for (const auto& condition : mConditions)
      labels.insert(condition.getWaveLabels().begin(), condition.getWaveLabels().end());

    return labels;
  }
} // namespace mkc_elliott
