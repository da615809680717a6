// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "StreamWaveSearchObserver.h"

namespace mkc_elliott
{
  StreamWaveSearchObserver::StreamWaveSearchObserver(std::ostream& os, bool verbose)
    : mStream(os),
      mVerbose(verbose),
      mMutex()
  {}

  void StreamWaveSearchObserver::onPhaseStarted(WavePatternType shape,
						std::size_t idxStart,
						std::uint64_t numOptions)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mStream << "Searching " << toString(shape) << " waves from bar " << idxStart
	    << " over " << numOptions << " skip combinations" << std::endl;
  }

  void StreamWaveSearchObserver::onPatternAccepted(WaveArchetype archetype,
						   const WaveOption& option,
						   const WavePattern& pattern)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mStream << "  " << toString(archetype) << " found with " << option << ": "
	    << pattern << std::endl;
  }

  void StreamWaveSearchObserver::onPatternRejected(WaveArchetype archetype,
						   const WaveOption& option,
						   const WavePattern& pattern)
  {
    if (!mVerbose)
      return;

    std::lock_guard<std::mutex> lock(mMutex);
    mStream << "  " << toString(archetype) << " rejected " << option << ": "
	    << pattern.getViolation().value_or("") << std::endl;
  }

  void StreamWaveSearchObserver::onPhaseFinished(WavePatternType shape,
						 std::size_t idxStart,
						 std::uint64_t optionsEvaluated,
						 bool cancelled)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mStream << "Finished " << toString(shape) << " search from bar " << idxStart
	    << " after " << optionsEvaluated << " combinations";
    if (cancelled)
      mStream << " (cancelled)";
    mStream << std::endl;
  }
} // namespace mkc_elliott
