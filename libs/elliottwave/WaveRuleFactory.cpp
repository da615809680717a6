// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WaveRuleFactory.h"
#include <boost/algorithm/string/predicate.hpp>
#include "ElliottWaveException.h"
#include "WaveTools.h"

namespace mkc_elliott
{
  namespace
  {
    const double W2_RETRACEMENT = 0.3;
    const double W4_RETRACEMENT = 0.24;
    const double W5_MIN_RATIO_OF_W3 = 0.24;

    double retracementLevel(const MonoWave& wave, double ratio)
    {
      return fibonacciLevel(wave.getLow(), wave.getHigh(), ratio, FibonacciMode::HighToLow);
    }

    double trendSlopeOfHighs(const MonoWave& waveA, const MonoWave& waveB)
    {
      return slope(static_cast<double>(waveA.getIdxEnd()), static_cast<double>(waveB.getIdxEnd()),
		   waveA.getHigh(), waveB.getHigh());
    }

    double trendSlopeOfLows(const MonoWave& waveA, const MonoWave& waveB)
    {
      return slope(static_cast<double>(waveA.getIdxEnd()), static_cast<double>(waveB.getIdxEnd()),
		   waveA.getLow(), waveB.getLow());
    }
  }

  std::string toString(WaveArchetype archetype)
  {
    switch (archetype)
      {
      case WaveArchetype::Impulse:
	return "Impulse";
      case WaveArchetype::Correction:
	return "Correction";
      case WaveArchetype::TDWave:
	return "TDWave";
      case WaveArchetype::LeadingDiagonal:
	return "LeadingDiagonal";
      case WaveArchetype::Impulse1WaveLongest:
	return "Impulse1WaveLongest";
      case WaveArchetype::Impulse3WaveLongest:
	return "Impulse3WaveLongest";
      case WaveArchetype::Impulse5WaveLongest:
	return "Impulse5WaveLongest";
      case WaveArchetype::ExpandingDiagonal:
	return "ExpandingDiagonal";
      case WaveArchetype::ContractingDiagonal:
	return "ContractingDiagonal";
      }

    throw InvalidArgumentException("toString: unknown WaveArchetype");
  }

  WaveArchetype archetypeFromString(const std::string& name)
  {
    for (auto archetype : WaveRuleFactory::allArchetypes())
      {
	if (boost::algorithm::iequals(name, toString(archetype)))
	  return archetype;
      }

    throw InvalidArgumentException("Unknown wave archetype '" + name + "'");
  }

  WavePatternType patternTypeFor(WaveArchetype archetype)
  {
    return (archetype == WaveArchetype::Correction) ? WavePatternType::Corrective
						    : WavePatternType::Impulsive;
  }

  std::vector<WaveArchetype> WaveRuleFactory::allArchetypes()
  {
    return { WaveArchetype::Impulse,
	     WaveArchetype::Correction,
	     WaveArchetype::TDWave,
	     WaveArchetype::LeadingDiagonal,
	     WaveArchetype::Impulse1WaveLongest,
	     WaveArchetype::Impulse3WaveLongest,
	     WaveArchetype::Impulse5WaveLongest,
	     WaveArchetype::ExpandingDiagonal,
	     WaveArchetype::ContractingDiagonal };
  }

  std::vector<WaveArchetype> WaveRuleFactory::defaultArchetypes()
  {
    return { WaveArchetype::Impulse1WaveLongest,
	     WaveArchetype::Impulse3WaveLongest,
	     WaveArchetype::Impulse5WaveLongest,
	     WaveArchetype::ExpandingDiagonal,
	     WaveArchetype::ContractingDiagonal,
	     WaveArchetype::Correction };
  }

  WaveRule WaveRuleFactory::create(WaveArchetype archetype, double xyRatio)
  {
    switch (archetype)
      {
      case WaveArchetype::Impulse:
	return createImpulse(xyRatio);
      case WaveArchetype::Correction:
	return createCorrection(xyRatio);
      case WaveArchetype::TDWave:
	return createTDWave(xyRatio);
      case WaveArchetype::LeadingDiagonal:
	return createLeadingDiagonal(xyRatio);
      case WaveArchetype::Impulse1WaveLongest:
	return createImpulse1WaveLongest(xyRatio);
      case WaveArchetype::Impulse3WaveLongest:
	return createImpulse3WaveLongest(xyRatio);
      case WaveArchetype::Impulse5WaveLongest:
	return createImpulse5WaveLongest(xyRatio);
      case WaveArchetype::ExpandingDiagonal:
	return createExpandingDiagonal(xyRatio);
      case WaveArchetype::ContractingDiagonal:
	return createContractingDiagonal(xyRatio);
      }

    throw InvalidArgumentException("WaveRuleFactory: unknown WaveArchetype");
  }

  WaveRule WaveRuleFactory::createImpulse(double xyRatio)
  {
    WaveRule rule("Impulse", xyRatio);

    rule.addCondition("w2_1", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLow() > w1.getLow(); },
		      "End of Wave2 is lower than Start of Wave1.");
    rule.addCondition("w2_2", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLength() >= 0.2 * w1.getLength(); },
		      "Wave2 is shorter than 20% of Wave1.");
    rule.addCondition("w2_3", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return 9 * w2.getDuration() > w1.getDuration(); },
		      "Wave2 is longer than 9x Wave1.");

    rule.addCondition("w3_1", {"wave1", "wave3", "wave5"},
		      [](const MonoWave& w1, const MonoWave& w3, const MonoWave& w5) {
			return !(w3.getLength() < w5.getLength() && w3.getLength() < w1.getLength());
		      },
		      "Wave3 is the shortest Wave.");
    rule.addCondition("w3_2", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getHigh() > w1.getHigh(); },
		      "End of Wave3 is lower than End of Wave1.");
    rule.addCondition("w3_3", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getLength() >= w1.getLength() / 3.0; },
		      "Wave3 is shorter than 1/3 of Wave1.");
    rule.addCondition("w3_4", {"wave2", "wave3"},
		      [](const MonoWave& w2, const MonoWave& w3) { return w3.getLength() > w2.getLength(); },
		      "Wave3 is shorter than Wave2.");
    rule.addCondition("w3_5", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return 7 * w3.getDuration() > w1.getDuration(); },
		      "Wave3 is more than 7 times longer than Wave1.");

    rule.addCondition("w4_1", {"wave1", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w4) { return w4.getLow() > w1.getHigh(); },
		      "End of Wave4 is lower than End of Wave1.");
    rule.addCondition("w4_2", {"wave2", "wave4"},
		      [](const MonoWave& w2, const MonoWave& w4) { return w4.getLength() > w2.getLength() / 3.0; },
		      "Wave4 is shorter than 1/3 of Wave2.");

    rule.addCondition("w5_1", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w3.getHigh() < w5.getHigh(); },
		      "End of Wave5 is lower than End of Wave3.");
    rule.addCondition("w5_2", {"wave1", "wave5"},
		      [](const MonoWave& w1, const MonoWave& w5) { return w5.getLength() < 2.0 * w1.getLength(); },
		      "Wave5 is longer (value wise) than 2x Wave1.");

    return rule;
  }

  WaveRule WaveRuleFactory::createCorrection(double xyRatio)
  {
    WaveRule rule("Correction", xyRatio);

    rule.addCondition("wB_1", {"wave1", "wave2"},
		      [](const MonoWave& a, const MonoWave& b) { return a.getHigh() > b.getHigh(); },
		      "End of WaveB is higher than Start of WaveA.");
    rule.addCondition("wC_1", {"wave1", "wave3"},
		      [](const MonoWave& a, const MonoWave& c) { return a.getLow() > c.getLow(); },
		      "End of WaveC is higher than End of WaveA.");
    rule.addCondition("wB_2", {"wave1", "wave2"},
		      [](const MonoWave& a, const MonoWave& b) { return a.getLength() > b.getLength(); },
		      "WaveB is longer than WaveA.");
    rule.addCondition("wB_3", {"wave1", "wave2"},
		      [](const MonoWave& a, const MonoWave& b) { return b.getDuration() < 10 * a.getDuration(); },
		      "WaveB is longer (time wise) than 10x WaveA.");
    rule.addCondition("wC_2", {"wave1", "wave3"},
		      [](const MonoWave& a, const MonoWave& c) { return c.getLength() > 0.6 * a.getLength(); },
		      "WaveC is shorter (value wise) than 0.6x WaveA.");
    rule.addCondition("wC_3", {"wave1", "wave3"},
		      [](const MonoWave& a, const MonoWave& c) { return c.getLength() < 2.61 * a.getLength(); },
		      "WaveC is longer (value wise) than 2.61x WaveA.");
    rule.addCondition("wB_4", {"wave1", "wave2"},
		      [](const MonoWave& a, const MonoWave& b) { return b.getLength() < 0.618 * a.getLength(); },
		      "WaveB is longer (value wise) than 0.618x WaveA.");
    rule.addCondition("wC_4", {"wave1", "wave3"},
		      [](const MonoWave& a, const MonoWave& c) { return c.getDuration() < 10 * a.getDuration(); },
		      "WaveC is longer (time wise) than 10x WaveA.");
    rule.addCondition("wB_5", {"wave1", "wave2"},
		      [](const MonoWave& a, const MonoWave& b) { return b.getLength() > 0.35 * a.getLength(); },
		      "WaveB is shorter (value wise) than 0.35x WaveA.");

    return rule;
  }

  WaveRule WaveRuleFactory::createTDWave(double xyRatio)
  {
    WaveRule rule("TDWave", xyRatio);

    rule.addCondition("w2_1", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLength() > w1.getLength() * 0.59; },
		      "Wave2 corrected less than 59% of Wave1.");
    rule.addCondition("w2_2", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLength() < w1.getLength() * 0.64; },
		      "Wave2 corrected more than 64% of Wave1.");
    rule.addCondition("w2_3", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return 9 * w2.getDuration() > w1.getDuration(); },
		      "Wave2 is longer than 9x Wave1.");

    return rule;
  }

  WaveRule WaveRuleFactory::createLeadingDiagonal(double xyRatio)
  {
    WaveRule rule("LeadingDiagonal", xyRatio);

    rule.addCondition("w2_0", {"wave1", "wave2", "wave3", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w2, const MonoWave& w3, const MonoWave& w4) {
			const double upper = trendSlopeOfHighs(w1, w3);
			const double lower = trendSlopeOfLows(w2, w4);
			return lower > upper && upper > 0.0;
		      },
		      "Trend lines of Wave1-3 and Wave2-4 do not converge.");
    rule.addCondition("w2_1", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLow() > w1.getLow(); },
		      "End of Wave2 is lower than Start of Wave1.");
    rule.addCondition("w2_2", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLength() >= 0.2 * w1.getLength(); },
		      "Wave2 is shorter than 20% of Wave1.");
    rule.addCondition("w2_3", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return 9 * w2.getDuration() > w1.getDuration(); },
		      "Wave2 is longer than 9x Wave1.");

    rule.addCondition("w3_1", {"wave1", "wave3", "wave5"},
		      [](const MonoWave& w1, const MonoWave& w3, const MonoWave& w5) {
			return !(w3.getLength() < w5.getLength() && w3.getLength() < w1.getLength());
		      },
		      "Wave3 is the shortest Wave.");
    rule.addCondition("w3_2", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getHigh() > w1.getHigh(); },
		      "End of Wave3 is lower than End of Wave1.");
    rule.addCondition("w3_3", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getLength() >= w1.getLength() / 3.0; },
		      "Wave3 is shorter than 1/3 of Wave1.");
    rule.addCondition("w3_4", {"wave2", "wave3"},
		      [](const MonoWave& w2, const MonoWave& w3) { return w3.getLength() > w2.getLength(); },
		      "Wave3 is shorter than Wave2.");
    rule.addCondition("w3_5", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return 7 * w3.getDuration() > w1.getDuration(); },
		      "Wave3 is more than 7 times longer than Wave1.");

    // Unlike an impulse, wave 4 must enter the territory of wave 1
    rule.addCondition("w4_1", {"wave1", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w4) { return w4.getLow() < w1.getHigh(); },
		      "End of Wave4 is not lower than End of Wave1.");
    rule.addCondition("w4_2", {"wave2", "wave4"},
		      [](const MonoWave& w2, const MonoWave& w4) { return w4.getLength() > w2.getLength() / 3.0; },
		      "Wave4 is shorter than 1/3 of Wave2.");

    rule.addCondition("w5_1", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w3.getHigh() < w5.getHigh(); },
		      "End of Wave5 is lower than End of Wave3.");
    rule.addCondition("w5_2", {"wave1", "wave5"},
		      [](const MonoWave& w1, const MonoWave& w5) { return w5.getLength() < 2.0 * w1.getLength(); },
		      "Wave5 is longer (value wise) than 2x Wave1.");
    rule.addCondition("w5_3", {"wave1", "wave5"},
		      [](const MonoWave& w1, const MonoWave& w5) { return w5.getLength() > 0.7 * w1.getLength(); },
		      "Wave5 is shorter (value wise) than 0.7x Wave1.");
    rule.addCondition("w5_4", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w5.getLength() < w3.getLength(); },
		      "Wave5 is not shorter (value wise) than Wave3.");

    return rule;
  }

  void WaveRuleFactory::addWave2Retracement(WaveRule& rule)
  {
    rule.addCondition("w2_1", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLow() > w1.getLow(); },
		      "End of Wave2 is lower than Start of Wave1.");
    rule.addCondition("w2_2", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) {
			return w2.getLow() < retracementLevel(w1, W2_RETRACEMENT);
		      },
		      "Wave2 retraces less than the 0.3 Fibonacci level of Wave1.");
  }

  WaveRule WaveRuleFactory::createImpulse3WaveLongest(double xyRatio)
  {
    WaveRule rule("Impulse3WaveLongest", xyRatio);

    addWave2Retracement(rule);

    rule.addCondition("w3_1", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getHigh() > w1.getHigh(); },
		      "End of Wave3 is lower than End of Wave1.");
    rule.addCondition("w3_2", {"wave1", "wave3"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w3) { return isLongerThan(w3, w1, xyRatio); },
		      "Wave3 is not longer (diagonal) than Wave1.");

    rule.addCondition("w4_1", {"wave1", "wave2", "wave3", "wave4"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w2, const MonoWave& w3, const MonoWave& w4) {
			return isLongerThan(w1, w4, xyRatio) && isLongerThan(w3, w4, xyRatio) &&
			  isLongerThan(w1, w2, xyRatio) && isLongerThan(w3, w2, xyRatio);
		      },
		      "Wave2 and Wave4 must both be shorter (diagonal) than Wave1 and Wave3.");
    rule.addCondition("w4_2", {"wave1", "wave3", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w3, const MonoWave& w4) {
			return w4.getLow() < retracementLevel(w3, W4_RETRACEMENT) && w4.getLow() > w1.getHigh();
		      },
		      "Wave4 must retrace past the 0.24 Fibonacci level of Wave3 and stay above End of Wave1.");

    rule.addCondition("w5_1", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w5.getHigh() > w3.getHigh(); },
		      "End of Wave5 is lower than End of Wave3.");
    rule.addCondition("w5_2", {"wave1", "wave3", "wave5"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w3, const MonoWave& w5) {
			return isLongerThan(w3, w1, xyRatio) && isLongerThan(w3, w5, xyRatio);
		      },
		      "Wave3 is not longer (diagonal) than Wave1 and Wave5.");
    rule.addCondition("w5_3", {"wave3", "wave5"},
		      [xyRatio](const MonoWave& w3, const MonoWave& w5) {
			const double ratio = diagonalRatio(w5, w3, xyRatio);
			return ratio > W5_MIN_RATIO_OF_W3 && ratio < 1.0;
		      },
		      "Wave5 must be between 0.24 and 1.0 of the diagonal length of Wave3.");

    return rule;
  }

  WaveRule WaveRuleFactory::createImpulse1WaveLongest(double xyRatio)
  {
    WaveRule rule("Impulse1WaveLongest", xyRatio);

    addWave2Retracement(rule);

    rule.addCondition("w3_1", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getHigh() > w1.getHigh(); },
		      "End of Wave3 is lower than End of Wave1.");
    rule.addCondition("w3_2", {"wave1", "wave3"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w3) { return isLongerThan(w1, w3, xyRatio); },
		      "Wave1 is not longer (diagonal) than Wave3.");

    rule.addCondition("w4_1", {"wave1", "wave2", "wave3", "wave4"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w2, const MonoWave& w3, const MonoWave& w4) {
			return isLongerThan(w1, w4, xyRatio) && isLongerThan(w3, w4, xyRatio) &&
			  isLongerThan(w1, w2, xyRatio) && isLongerThan(w3, w2, xyRatio);
		      },
		      "Wave2 and Wave4 must both be shorter (diagonal) than Wave1 and Wave3.");
    rule.addCondition("w4_2", {"wave1", "wave3", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w3, const MonoWave& w4) {
			return w4.getLow() < retracementLevel(w3, W4_RETRACEMENT) && w4.getLow() > w1.getHigh();
		      },
		      "Wave4 must retrace past the 0.24 Fibonacci level of Wave3 and stay above End of Wave1.");

    rule.addCondition("w5_1", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w5.getHigh() > w3.getHigh(); },
		      "End of Wave5 is lower than End of Wave3.");
    rule.addCondition("w5_2", {"wave1", "wave5"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w5) { return isLongerThan(w1, w5, xyRatio); },
		      "Wave1 is not longer (diagonal) than Wave5.");
    rule.addCondition("w5_3", {"wave3", "wave5"},
		      [xyRatio](const MonoWave& w3, const MonoWave& w5) { return isLongerThan(w3, w5, xyRatio); },
		      "Wave3 is not longer (diagonal) than Wave5.");

    return rule;
  }

  WaveRule WaveRuleFactory::createImpulse5WaveLongest(double xyRatio)
  {
    WaveRule rule("Impulse5WaveLongest", xyRatio);

    addWave2Retracement(rule);

    rule.addCondition("w3_1", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getHigh() > w1.getHigh(); },
		      "End of Wave3 is lower than End of Wave1.");
    rule.addCondition("w3_2", {"wave1", "wave3"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w3) { return isLongerThan(w3, w1, xyRatio); },
		      "Wave3 is not longer (diagonal) than Wave1.");

    rule.addCondition("w4_1", {"wave1", "wave2", "wave3", "wave4"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w2, const MonoWave& w3, const MonoWave& w4) {
			return isLongerThan(w1, w4, xyRatio) && isLongerThan(w3, w4, xyRatio) &&
			  isLongerThan(w1, w2, xyRatio) && isLongerThan(w3, w2, xyRatio);
		      },
		      "Wave2 and Wave4 must both be shorter (diagonal) than Wave1 and Wave3.");
    rule.addCondition("w4_2", {"wave1", "wave3", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w3, const MonoWave& w4) {
			return w4.getLow() < retracementLevel(w3, W4_RETRACEMENT) && w4.getLow() > w1.getHigh();
		      },
		      "Wave4 must retrace past the 0.24 Fibonacci level of Wave3 and stay above End of Wave1.");

    rule.addCondition("w5_1", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w5.getHigh() > w3.getHigh(); },
		      "End of Wave5 is lower than End of Wave3.");
    rule.addCondition("w5_2", {"wave3", "wave5"},
		      [xyRatio](const MonoWave& w3, const MonoWave& w5) { return isLongerThan(w5, w3, xyRatio); },
		      "Wave5 is not longer (diagonal) than Wave3.");

    return rule;
  }

  void WaveRuleFactory::addOverlappingWave4(WaveRule& rule)
  {
    rule.addCondition("w4_1", {"wave1", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w4) { return w4.getLow() < w1.getHigh(); },
		      "End of Wave4 does not overlap Wave1.");
    rule.addCondition("w4_2", {"wave2", "wave4"},
		      [](const MonoWave& w2, const MonoWave& w4) { return w4.getLow() > w2.getLow(); },
		      "End of Wave4 is lower than End of Wave2.");
  }

  WaveRule WaveRuleFactory::createExpandingDiagonal(double xyRatio)
  {
    WaveRule rule("ExpandingDiagonal", xyRatio);

    rule.addCondition("w2_1", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLow() > w1.getLow(); },
		      "End of Wave2 is lower than Start of Wave1.");
    rule.addCondition("w3_1", {"wave1", "wave3"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w3) { return isLongerThan(w3, w1, xyRatio); },
		      "Wave3 is not longer (diagonal) than Wave1.");

    addOverlappingWave4(rule);

    rule.addCondition("w4_3", {"wave2", "wave4"},
		      [xyRatio](const MonoWave& w2, const MonoWave& w4) { return isLongerThan(w4, w2, xyRatio); },
		      "Wave4 is not longer (diagonal) than Wave2.");
    rule.addCondition("w5_1", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w5.getHigh() > w3.getHigh(); },
		      "End of Wave5 is lower than End of Wave3.");
    rule.addCondition("w5_2", {"wave3", "wave5"},
		      [xyRatio](const MonoWave& w3, const MonoWave& w5) { return isLongerThan(w5, w3, xyRatio); },
		      "Wave5 is not longer (diagonal) than Wave3.");
    rule.addCondition("w5_3", {"wave1", "wave2", "wave3", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w2, const MonoWave& w3, const MonoWave& w4) {
			return trendSlopeOfHighs(w1, w3) > trendSlopeOfLows(w2, w4);
		      },
		      "Trend lines of Wave1-3 and Wave2-4 do not diverge.");

    return rule;
  }

  WaveRule WaveRuleFactory::createContractingDiagonal(double xyRatio)
  {
    WaveRule rule("ContractingDiagonal", xyRatio);

    rule.addCondition("w2_1", {"wave1", "wave2"},
		      [](const MonoWave& w1, const MonoWave& w2) { return w2.getLow() > w1.getLow(); },
		      "End of Wave2 is lower than Start of Wave1.");
    rule.addCondition("w3_1", {"wave1", "wave3"},
		      [](const MonoWave& w1, const MonoWave& w3) { return w3.getHigh() > w1.getHigh(); },
		      "End of Wave3 is lower than End of Wave1.");
    rule.addCondition("w3_2", {"wave1", "wave3"},
		      [xyRatio](const MonoWave& w1, const MonoWave& w3) { return isLongerThan(w1, w3, xyRatio); },
		      "Wave3 is not shorter (diagonal) than Wave1.");

    addOverlappingWave4(rule);

    rule.addCondition("w4_3", {"wave2", "wave4"},
		      [xyRatio](const MonoWave& w2, const MonoWave& w4) { return isLongerThan(w2, w4, xyRatio); },
		      "Wave4 is not shorter (diagonal) than Wave2.");
    rule.addCondition("w5_1", {"wave3", "wave5"},
		      [](const MonoWave& w3, const MonoWave& w5) { return w5.getHigh() > w3.getHigh(); },
		      "End of Wave5 is lower than End of Wave3.");
    rule.addCondition("w5_2", {"wave3", "wave5"},
		      [xyRatio](const MonoWave& w3, const MonoWave& w5) { return isLongerThan(w3, w5, xyRatio); },
		      "Wave5 is not shorter (diagonal) than Wave3.");
    rule.addCondition("w5_3", {"wave1", "wave2", "wave3", "wave4"},
		      [](const MonoWave& w1, const MonoWave& w2, const MonoWave& w3, const MonoWave& w4) {
			const double upper = trendSlopeOfHighs(w1, w3);
			const double lower = trendSlopeOfLows(w2, w4);
			return lower > upper && upper > 0.0;
		      },
		      "Trend lines of Wave1-3 and Wave2-4 do not converge.");

    return rule;
  }
} // namespace mkc_elliott
