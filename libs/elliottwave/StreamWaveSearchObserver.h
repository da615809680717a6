// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <mutex>
#include <ostream>
#include "IWaveSearchObserver.h"

namespace mkc_elliott
{
  /**
   * @brief Writes one line per search event to a stream (console, log file
   * or a tee of both). Rejections are only written in verbose mode.
   */
  class StreamWaveSearchObserver : public IWaveSearchObserver
  {
  public:
    explicit StreamWaveSearchObserver(std::ostream& os, bool verbose = false);
    ~StreamWaveSearchObserver() override = default;

    void onPhaseStarted(WavePatternType shape,
			std::size_t idxStart,
			std::uint64_t numOptions) override;

    void onPatternAccepted(WaveArchetype archetype,
			   const WaveOption& option,
			   const WavePattern& pattern) override;

    void onPatternRejected(WaveArchetype archetype,
			   const WaveOption& option,
			   const WavePattern& pattern) override;

    void onPhaseFinished(WavePatternType shape,
			 std::size_t idxStart,
			 std::uint64_t optionsEvaluated,
			 bool cancelled) override;

  private:
    std::ostream& mStream;
    bool mVerbose;
    std::mutex mMutex;
  };
} // namespace mkc_elliott
