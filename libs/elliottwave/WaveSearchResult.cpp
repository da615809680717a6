// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WaveSearchResult.h"
#include <algorithm>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  WaveSearchResult::WaveSearchResult(std::size_t idxStart, const std::vector<WaveArchetype>& archetypes)
    : mStartIndex(idxStart),
      mArchetypeResults(),
      mImpulseOptionsEvaluated(0),
      mCorrectionOptionsEvaluated(0),
      mCorrectionStarts(),
      mCancelled(false)
  {
    for (auto archetype : archetypes)
      {
	if (!hasResult(archetype))
	  mArchetypeResults.emplace_back(archetype);
      }
  }

  bool WaveSearchResult::hasResult(WaveArchetype archetype) const
  {
    return std::any_of(mArchetypeResults.begin(), mArchetypeResults.end(),
		       [archetype](const ArchetypeSearchResult& r) { return r.getArchetype() == archetype; });
  }

  const ArchetypeSearchResult& WaveSearchResult::getResult(WaveArchetype archetype) const
  {
    for (const auto& result : mArchetypeResults)
      {
	if (result.getArchetype() == archetype)
	  return result;
      }

    throw InvalidArgumentException("WaveSearchResult: archetype " + toString(archetype) +
				   " was not searched");
  }

  ArchetypeSearchResult& WaveSearchResult::getResult(WaveArchetype archetype)
  {
    const auto& self = *this;
    return const_cast<ArchetypeSearchResult&>(self.getResult(archetype));
  }

  std::size_t WaveSearchResult::getNumAccepted() const
  {
    std::size_t total = 0;
    for (const auto& result : mArchetypeResults)
      total += result.getAccepted().size();

    return total;
  }

  std::size_t WaveSearchResult::getNumRejected() const
  {
    std::size_t total = 0;
    for (const auto& result : mArchetypeResults)
      total += result.getRejected().size();

    return total;
  }
} // namespace mkc_elliott
