// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_RULE_FACTORY_H
#define __ELLIOTT_WAVE_RULE_FACTORY_H 1

#include <string>
#include <vector>
#include "WavePattern.h"
#include "WaveRule.h"

namespace mkc_elliott
{
  enum class WaveArchetype
  {
    Impulse,
    Correction,
    TDWave,
    LeadingDiagonal,
    Impulse1WaveLongest,
    Impulse3WaveLongest,
    Impulse5WaveLongest,
    ExpandingDiagonal,
    ContractingDiagonal
  };

  std::string toString(WaveArchetype archetype);

  /**
   * @brief Parses an archetype name (case insensitive), e.g. "Impulse3WaveLongest".
   * @throws InvalidArgumentException for an unknown name.
   */
  WaveArchetype archetypeFromString(const std::string& name);

  // Shape of the candidates an archetype is checked against
  WavePatternType patternTypeFor(WaveArchetype archetype);

  /**
   * @class WaveRuleFactory
   * @brief Builds the condition table of each archetype.
   *
   * The classic tables (Impulse, Correction, TDWave, LeadingDiagonal) compare
   * raw price lengths and durations. The practical variants compare waves with
   * the pairwise normalised diagonal length, weighted by the rule's x/y ratio,
   * and bound retracements with Fibonacci levels.
   */
  class WaveRuleFactory
  {
  public:
    static WaveRule create(WaveArchetype archetype, double xyRatio = DEFAULT_XY_RATIO);

    static std::vector<WaveArchetype> allArchetypes();

    // The five practical variants plus Correction
    static std::vector<WaveArchetype> defaultArchetypes();

    static WaveRule createImpulse(double xyRatio);
    static WaveRule createCorrection(double xyRatio);
    static WaveRule createTDWave(double xyRatio);
    static WaveRule createLeadingDiagonal(double xyRatio);
    static WaveRule createImpulse1WaveLongest(double xyRatio);
    static WaveRule createImpulse3WaveLongest(double xyRatio);
    static WaveRule createImpulse5WaveLongest(double xyRatio);
    static WaveRule createExpandingDiagonal(double xyRatio);
    static WaveRule createContractingDiagonal(double xyRatio);

  private:
    static void addWave2Retracement(WaveRule& rule);
    static void addOverlappingWave4(WaveRule& rule);
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_RULE_FACTORY_H
