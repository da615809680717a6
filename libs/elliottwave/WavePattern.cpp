// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WavePattern.h"
#include <algorithm>
#include <boost/functional/hash.hpp>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  namespace
  {
    std::size_t expectedWaveCount(WavePatternType type)
    {
      return (type == WavePatternType::Impulsive) ? 5 : 3;
    }

    std::size_t positionOfKey(const std::string& key)
    {
      const std::string prefix("wave");
      if (key.size() != prefix.size() + 1 || key.compare(0, prefix.size(), prefix) != 0)
	return 0;

      const char digit = key.back();
      if (digit < '1' || digit > '9')
	return 0;

      return static_cast<std::size_t>(digit - '0');
    }
  }

  std::string toString(WavePatternType type)
  {
    return (type == WavePatternType::Impulsive) ? std::string("Impulsive") : std::string("Corrective");
  }

  std::string waveKey(std::size_t position)
  {
    return "wave" + std::to_string(position + 1);
  }

  WavePattern::WavePattern(WavePatternType type, const std::vector<MonoWave>& waves)
    : mType(type),
      mWaves(waves),
      mViolation()
  {
    if (mWaves.size() != expectedWaveCount(type))
      throw InvalidConfigurationException("WavePattern: a " + toString(type) + " pattern needs " +
					  std::to_string(expectedWaveCount(type)) + " waves, got " +
					  std::to_string(mWaves.size()));

    for (std::size_t i = 1; i < mWaves.size(); ++i)
      {
	if (mWaves[i - 1].getIdxEnd() != mWaves[i].getIdxStart())
	  throw InvalidConfigurationException("WavePattern: " + waveKey(i - 1) + " ends at " +
					      std::to_string(mWaves[i - 1].getIdxEnd()) + " but " +
					      waveKey(i) + " starts at " +
					      std::to_string(mWaves[i].getIdxStart()));
      }
  }

  bool WavePattern::hasWave(const std::string& key) const
  {
    const std::size_t position = positionOfKey(key);
    return position >= 1 && position <= mWaves.size();
  }

  const MonoWave& WavePattern::getWave(const std::string& key) const
  {
    if (!hasWave(key))
      throw WaveRuleException("WavePattern: " + toString(mType) + " pattern has no wave " + key);

    return mWaves[positionOfKey(key) - 1];
  }

  std::vector<std::string> WavePattern::getWaveKeys() const
  {
    std::vector<std::string> keys;
    for (std::size_t i = 0; i < mWaves.size(); ++i)
      keys.push_back(waveKey(i));

    return keys;
  }

  unsigned long WavePattern::getTotalSkips() const
  {
    unsigned long total = 0;
    for (const auto& wave : mWaves)
      total += wave.getSkipCount();

    return total;
  }

  std::vector<ptime> WavePattern::dates() const
  {
    std::vector<ptime> result;
    result.reserve(mWaves.size() + 1);
    result.push_back(mWaves.front().getDateStart());

    for (const auto& wave : mWaves)
      result.push_back(wave.getDateEnd());

    return result;
  }

  std::vector<double> WavePattern::values() const
  {
    std::vector<double> result;
    result.reserve(mWaves.size() + 1);
    result.push_back(mWaves.front().getStartValue());

    for (const auto& wave : mWaves)
      result.push_back(wave.getEndValue());

    return result;
  }

  std::vector<std::string> WavePattern::labels() const
  {
    static const char* impulseLabels[] = { "1", "2", "3", "4", "5" };
    static const char* correctionLabels[] = { "A", "B", "C" };

    std::vector<std::string> result;
    result.reserve(mWaves.size() + 1);
    result.push_back(std::string());

    for (std::size_t i = 0; i < mWaves.size(); ++i)
      result.push_back(isImpulsive() ? impulseLabels[i] : correctionLabels[i]);

    return result;
  }

  bool WavePattern::checkRule(const WaveRule& rule)
  {
    for (const auto& label : rule.getRequiredLabels())
      {
	if (!hasWave(label))
	  throw WaveRuleException("WavePattern: rule " + rule.getName() + " reads " + label +
				  " which a " + toString(mType) + " pattern does not have");
      }

    std::vector<const MonoWave*> arguments;
    for (auto it = rule.beginConditions(); it != rule.endConditions(); ++it)
      {
	arguments.clear();
	for (const auto& label : it->getWaveLabels())
	  arguments.push_back(&getWave(label));

	if (!it->evaluate(arguments))
	  {
	    mViolation = it->getMessage();
	    return false;
	  }
      }

    mViolation.reset();
    return true;
  }

  MonoWave WavePattern::toHigherDegreeWave() const
  {
    const MonoWave& first = mWaves.front();
    const MonoWave& last = mWaves.back();

    unsigned int degree = 0;
    for (const auto& wave : mWaves)
      degree = std::max(degree, wave.getDegree());

    if (first.isUp())
      return MonoWave(WaveDirection::Up,
		      first.getIdxStart(), last.getIdxEnd(),
		      first.getLow(), first.getLowIdx(),
		      last.getHigh(), last.getHighIdx(),
		      first.getDateStart(), last.getDateEnd(),
		      0, degree + 1);

    return MonoWave(WaveDirection::Down,
		    first.getIdxStart(), last.getIdxEnd(),
		    last.getLow(), last.getLowIdx(),
		    first.getHigh(), first.getHighIdx(),
		    first.getDateStart(), last.getDateEnd(),
		    0, degree + 1);
  }

  bool operator==(const WavePattern& lhs, const WavePattern& rhs)
  {
    if (lhs.getIdxStart() != rhs.getIdxStart() ||
	lhs.getIdxEnd() != rhs.getIdxEnd() ||
	lhs.getNumWaves() != rhs.getNumWaves())
      return false;

    for (std::size_t i = 0; i < lhs.getNumWaves(); ++i)
      {
	const MonoWave& a = lhs.getWaves()[i];
	const MonoWave& b = rhs.getWaves()[i];

	if (a.getLow() != b.getLow() || a.getHigh() != b.getHigh() ||
	    a.getIdxStart() != b.getIdxStart() || a.getIdxEnd() != b.getIdxEnd())
	  return false;
      }

    return true;
  }

  bool operator!=(const WavePattern& lhs, const WavePattern& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const WavePattern& pattern)
  {
    const auto labels = pattern.labels();
    os << toString(pattern.getType()) << " [" << pattern.getIdxStart()
       << "->" << pattern.getIdxEnd() << "]";

    for (std::size_t i = 0; i < pattern.getNumWaves(); ++i)
      os << " " << labels[i + 1] << ":" << pattern.getWaves()[i];

    return os;
  }

  std::size_t WavePatternHash::operator()(const WavePattern& pattern) const
  {
    std::size_t seed = 0;
    boost::hash_combine(seed, pattern.getIdxStart());
    boost::hash_combine(seed, pattern.getIdxEnd());

    for (const auto& wave : pattern.getWaves())
      {
	boost::hash_combine(seed, wave.getLow());
	boost::hash_combine(seed, wave.getHigh());
	boost::hash_combine(seed, wave.getIdxStart());
	boost::hash_combine(seed, wave.getIdxEnd());
      }

    return seed;
  }
} // namespace mkc_elliott
