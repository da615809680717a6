// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <cstdint>
#include "WaveOptions.h"
#include "WavePattern.h"
#include "WaveRuleFactory.h"

namespace mkc_elliott
{
  /**
   * @brief Receives search events in canonical option order.
   *
   * Callbacks are made from the thread driving the search, never from
   * executor workers.
   */
  class IWaveSearchObserver
  {
  public:
    virtual ~IWaveSearchObserver() = default;

    virtual void onPhaseStarted(WavePatternType shape,
				std::size_t idxStart,
				std::uint64_t numOptions) = 0;

    virtual void onPatternAccepted(WaveArchetype archetype,
				   const WaveOption& option,
				   const WavePattern& pattern) = 0;

    virtual void onPatternRejected(WaveArchetype archetype,
				   const WaveOption& option,
				   const WavePattern& pattern) = 0;

    virtual void onPhaseFinished(WavePatternType shape,
				 std::size_t idxStart,
				 std::uint64_t optionsEvaluated,
				 bool cancelled) = 0;
  };

  class NullWaveSearchObserver : public IWaveSearchObserver
  {
  public:
    NullWaveSearchObserver() = default;
    ~NullWaveSearchObserver() override = default;

    void onPhaseStarted(WavePatternType, std::size_t, std::uint64_t) override {}
    void onPatternAccepted(WaveArchetype, const WaveOption&, const WavePattern&) override {}
    void onPatternRejected(WaveArchetype, const WaveOption&, const WavePattern&) override {}
    void onPhaseFinished(WavePatternType, std::size_t, std::uint64_t, bool) override {}
  };
} // namespace mkc_elliott
