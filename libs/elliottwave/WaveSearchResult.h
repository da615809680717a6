// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_SEARCH_RESULT_H
#define __ELLIOTT_WAVE_SEARCH_RESULT_H 1

#include <cstddef>
#include <cstdint>
#include <vector>
#include "WaveOptions.h"
#include "WavePattern.h"
#include "WaveRuleFactory.h"

namespace mkc_elliott
{
  // A pattern together with the first skip tuple that produced it
  struct WaveCandidate
  {
    WaveCandidate(const WaveOption& opt, const WavePattern& pat)
      : option(opt),
	pattern(pat)
    {}

    WaveOption option;
    WavePattern pattern;
  };

  class ArchetypeSearchResult
  {
  public:
    explicit ArchetypeSearchResult(WaveArchetype archetype)
      : mArchetype(archetype),
	mAccepted(),
	mRejected()
    {}

    WaveArchetype getArchetype() const
    {
      return mArchetype;
    }

    // Distinct accepted patterns in discovery order
    const std::vector<WaveCandidate>& getAccepted() const
    {
      return mAccepted;
    }

    // Distinct rejected patterns, each carrying its violation
    const std::vector<WaveCandidate>& getRejected() const
    {
      return mRejected;
    }

    void addAccepted(const WaveCandidate& candidate)
    {
      mAccepted.push_back(candidate);
    }

    void addRejected(const WaveCandidate& candidate)
    {
      mRejected.push_back(candidate);
    }

  private:
    WaveArchetype mArchetype;
    std::vector<WaveCandidate> mAccepted;
    std::vector<WaveCandidate> mRejected;
  };

  /**
   * @class WaveSearchResult
   * @brief Outcome of one search run: per archetype results in the order the
   * archetypes were configured, plus run statistics.
   */
  class WaveSearchResult
  {
  public:
    WaveSearchResult(std::size_t idxStart, const std::vector<WaveArchetype>& archetypes);

    std::size_t getStartIndex() const
    {
      return mStartIndex;
    }

    const std::vector<ArchetypeSearchResult>& getArchetypeResults() const
    {
      return mArchetypeResults;
    }

    /**
     * @throws InvalidArgumentException if the archetype was not part of the run.
     */
    const ArchetypeSearchResult& getResult(WaveArchetype archetype) const;
    ArchetypeSearchResult& getResult(WaveArchetype archetype);

    bool hasResult(WaveArchetype archetype) const;

    std::size_t getNumAccepted() const;
    std::size_t getNumRejected() const;

    std::uint64_t getImpulseOptionsEvaluated() const
    {
      return mImpulseOptionsEvaluated;
    }

    std::uint64_t getCorrectionOptionsEvaluated() const
    {
      return mCorrectionOptionsEvaluated;
    }

    // Bars the corrective search was started from
    const std::vector<std::size_t>& getCorrectionStarts() const
    {
      return mCorrectionStarts;
    }

    bool isCancelled() const
    {
      return mCancelled;
    }

    void addImpulseOptionsEvaluated(std::uint64_t count)
    {
      mImpulseOptionsEvaluated += count;
    }

    void addCorrectionOptionsEvaluated(std::uint64_t count)
    {
      mCorrectionOptionsEvaluated += count;
    }

    void addCorrectionStart(std::size_t idx)
    {
      mCorrectionStarts.push_back(idx);
    }

    void setCancelled()
    {
      mCancelled = true;
    }

  private:
    std::size_t mStartIndex;
    std::vector<ArchetypeSearchResult> mArchetypeResults;
    std::uint64_t mImpulseOptionsEvaluated;
    std::uint64_t mCorrectionOptionsEvaluated;
    std::vector<std::size_t> mCorrectionStarts;
    bool mCancelled;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_SEARCH_RESULT_H
