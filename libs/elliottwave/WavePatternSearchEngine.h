// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_PATTERN_SEARCH_ENGINE_H
#define __ELLIOTT_WAVE_PATTERN_SEARCH_ENGINE_H 1

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <unordered_set>
#include <vector>
#include "ElliottWaveException.h"
#include "IWaveSearchObserver.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "PriceSeries.h"
#include "SearchCancellation.h"
#include "WaveAnalyzer.h"
#include "WaveOptions.h"
#include "WavePattern.h"
#include "WaveRule.h"
#include "WaveRuleFactory.h"
#include "WaveSearchConfiguration.h"
#include "WaveSearchResult.h"

namespace mkc_elliott
{
  /**
   * @class WavePatternSearchEngine
   * @brief Enumerates every skip tuple of the configured range, chains the
   * corresponding waves and sorts the resulting candidates into accepted and
   * rejected patterns per archetype.
   *
   * Impulsive archetypes are searched first from the start bar. Corrective
   * archetypes are then searched from the end of every distinct accepted
   * impulse (or from the start bar when corrections do not follow impulses).
   *
   * Chain construction is a read-only map over the option list and runs on
   * the Executor in batches. Rule checks, de-duplication and observer
   * callbacks run on the calling thread in ascending option order, so the
   * result does not depend on the executor.
   *
   * Accepted patterns share one set per shape: a distinct impulse (or
   * correction) is reported once, under the first archetype in configured
   * order that accepts it, with the cheapest option that produced it.
   * Rejections are kept per archetype.
   *
   * @tparam Executor Executor policy from ParallelExecutors.h.
   */
  template <class Executor = concurrency::SingleThreadExecutor>
  class WavePatternSearchEngine
  {
  public:
    // Options mapped per parallel batch; bounds memory and cancellation latency
    static constexpr std::size_t BATCH_SIZE = 4096;

    WavePatternSearchEngine(const PriceSeries& series,
			    const WaveSearchConfiguration& config,
			    std::shared_ptr<IWaveSearchObserver> observer =
			      std::make_shared<NullWaveSearchObserver>())
      : WavePatternSearchEngine(series, config, std::make_shared<Executor>(), observer)
    {}

    WavePatternSearchEngine(const PriceSeries& series,
			    const WaveSearchConfiguration& config,
			    std::shared_ptr<Executor> executor,
			    std::shared_ptr<IWaveSearchObserver> observer)
      : mConfig(config),
	mAnalyzer(series, config.getZigZagThreshold()),
	mExecutor(executor),
	mObserver(observer),
	mRules()
    {
      if (!mExecutor)
	throw InvalidConfigurationException("WavePatternSearchEngine: executor is null");

      if (!mObserver)
	throw InvalidConfigurationException("WavePatternSearchEngine: observer is null");

      for (auto archetype : mConfig.getArchetypes())
	mRules.push_back(WaveRuleFactory::create(archetype, mConfig.getXYRatio()));
    }

    WavePatternSearchEngine(const WavePatternSearchEngine&) = delete;
    WavePatternSearchEngine& operator=(const WavePatternSearchEngine&) = delete;

    const WaveSearchConfiguration& getConfiguration() const
    {
      return mConfig;
    }

    const WaveAnalyzer& getAnalyzer() const
    {
      return mAnalyzer;
    }

    /**
     * @brief Searches from the bar with the lowest low of the series.
     */
    WaveSearchResult run() const
    {
      return run(mAnalyzer.getDefaultStartIndex());
    }

    /**
     * @brief Searches from idxStart, bounded by the configured time limit.
     */
    WaveSearchResult run(std::size_t idxStart) const
    {
      SearchCancellation cancellation;
      if (mConfig.getMaxSearchMillis() > 0)
	cancellation.setTimeout(std::chrono::milliseconds(mConfig.getMaxSearchMillis()));

      return run(idxStart, cancellation);
    }

    /**
     * @brief Searches from idxStart until done or until @p cancellation
     * fires. A cancelled result holds everything found in the options
     * evaluated before the stop, in canonical order, and isCancelled() is
     * set.
     *
     * @throws InvalidConfigurationException if idxStart is outside the series
     *         or the skip range is too large to enumerate.
     */
    WaveSearchResult run(std::size_t idxStart, const SearchCancellation& cancellation) const
    {
      const PriceSeries& series = mAnalyzer.getSeries();
      if (idxStart >= series.size())
	throw InvalidConfigurationException("WavePatternSearchEngine: start index " +
					    std::to_string(idxStart) + " is outside a series of " +
					    std::to_string(series.size()) + " bars");

      WaveSearchResult result(idxStart, mConfig.getArchetypes());
      DedupSets seen(mRules.size());

      const auto impulseRules = rulesForShape(WavePatternType::Impulsive);
      const auto correctionRules = rulesForShape(WavePatternType::Corrective);

      if (!impulseRules.empty())
	{
	  PatternFinder finder = [this, idxStart](const WaveOption& option) {
	    return mConfig.useZigZag() ? mAnalyzer.findImpulsiveWaveZigzag(idxStart, option)
				       : mAnalyzer.findImpulsiveWave(idxStart, option);
	  };

	  const auto evaluated = searchPhase(WavePatternType::Impulsive, idxStart, finder,
					     impulseRules, result, seen, cancellation);
	  result.addImpulseOptionsEvaluated(evaluated);
	}

      if (!correctionRules.empty() && !result.isCancelled())
	{
	  for (auto start : correctionStarts(idxStart, impulseRules, result))
	    {
	      result.addCorrectionStart(start);

	      PatternFinder finder = [this, start](const WaveOption& option) {
		return mAnalyzer.findCorrectiveWave(start, option, WaveDirection::Down);
	      };

	      const auto evaluated = searchPhase(WavePatternType::Corrective, start, finder,
						 correctionRules, result, seen, cancellation);
	      result.addCorrectionOptionsEvaluated(evaluated);

	      if (result.isCancelled())
		break;
	    }
	}

      return result;
    }

  private:
    using PatternFinder = std::function<std::optional<WavePattern>(const WaveOption&)>;
    using PatternSet = std::unordered_set<WavePattern, WavePatternHash>;

    // Accepted sets per shape, rejected sets per configured archetype
    struct DedupSets
    {
      explicit DedupSets(std::size_t numRules)
	: acceptedImpulses(),
	  acceptedCorrections(),
	  rejected(numRules)
      {}

      PatternSet& accepted(WavePatternType shape)
      {
	return (shape == WavePatternType::Impulsive) ? acceptedImpulses : acceptedCorrections;
      }

      PatternSet acceptedImpulses;
      PatternSet acceptedCorrections;
      std::vector<PatternSet> rejected;
    };

    std::vector<std::size_t> rulesForShape(WavePatternType shape) const
    {
      std::vector<std::size_t> indices;
      const auto& archetypes = mConfig.getArchetypes();

      for (std::size_t i = 0; i < archetypes.size(); ++i)
	{
	  if (patternTypeFor(archetypes[i]) == shape)
	    indices.push_back(i);
	}

      return indices;
    }

    std::vector<std::size_t> correctionStarts(std::size_t idxStart,
					      const std::vector<std::size_t>& impulseRules,
					      const WaveSearchResult& result) const
    {
      if (!mConfig.searchCorrections() || impulseRules.empty())
	return { idxStart };

      const auto& archetypes = mConfig.getArchetypes();
      std::vector<std::size_t> starts;
      std::set<std::size_t> known;

      for (auto ruleIdx : impulseRules)
	{
	  for (const auto& candidate : result.getResult(archetypes[ruleIdx]).getAccepted())
	    {
	      const std::size_t end = candidate.pattern.getIdxEnd();
	      if (known.insert(end).second)
		starts.push_back(end);
	    }
	}

      return starts;
    }

    std::uint64_t searchPhase(WavePatternType shape,
			      std::size_t idxStart,
			      const PatternFinder& finder,
			      const std::vector<std::size_t>& ruleIndices,
			      WaveSearchResult& result,
			      DedupSets& seen,
			      const SearchCancellation& cancellation) const
    {
      const std::size_t numSlots = (shape == WavePatternType::Impulsive) ? IMPULSE_WAVE_COUNT
									 : CORRECTIVE_WAVE_COUNT;
      WaveOptionsGenerator generator(numSlots, mConfig.getSkipFrom(), mConfig.getSkipTo());
      const auto& options = generator.getOptionsSorted();

      mObserver->onPhaseStarted(shape, idxStart, generator.getNumberOfOptions());

      std::uint64_t evaluatedCount = 0;
      std::vector<std::optional<WavePattern>> patterns;
      std::vector<char> evaluated;

      for (std::size_t batchStart = 0; batchStart < options.size(); batchStart += BATCH_SIZE)
	{
	  if (cancellation.isCancelled())
	    {
	      result.setCancelled();
	      break;
	    }

	  const std::size_t batchSize = std::min(BATCH_SIZE, options.size() - batchStart);
	  patterns.assign(batchSize, std::nullopt);
	  evaluated.assign(batchSize, 0);

	  concurrency::parallel_for(batchSize, *mExecutor,
				    [&](std::size_t i) {
				      if (cancellation.isCancelled())
					return;
				      patterns[i] = finder(options[batchStart + i]);
				      evaluated[i] = 1;
				    });

	  // Only the unbroken prefix of evaluated options counts
	  for (std::size_t i = 0; i < batchSize; ++i)
	    {
	      if (!evaluated[i])
		{
		  result.setCancelled();
		  break;
		}

	      ++evaluatedCount;
	      if (patterns[i])
		classify(shape, *patterns[i], options[batchStart + i], ruleIndices, result, seen);
	    }

	  if (result.isCancelled())
	    break;
	}

      mObserver->onPhaseFinished(shape, idxStart, evaluatedCount, result.isCancelled());
      return evaluatedCount;
    }

    void classify(WavePatternType shape,
		  const WavePattern& pattern,
		  const WaveOption& option,
		  const std::vector<std::size_t>& ruleIndices,
		  WaveSearchResult& result,
		  DedupSets& seen) const
    {
      const auto& archetypes = mConfig.getArchetypes();
      PatternSet& accepted = seen.accepted(shape);

      for (auto ruleIdx : ruleIndices)
	{
	  WavePattern candidate(pattern);
	  const WaveArchetype archetype = archetypes[ruleIdx];

	  if (candidate.checkRule(mRules[ruleIdx]))
	    {
	      // Already claimed by an earlier archetype or option
	      if (accepted.insert(candidate).second)
		{
		  result.getResult(archetype).addAccepted(WaveCandidate(option, candidate));
		  mObserver->onPatternAccepted(archetype, option, candidate);
		}
	    }
	  else if (mConfig.collectRejections())
	    {
	      if (seen.rejected[ruleIdx].insert(candidate).second)
		{
		  result.getResult(archetype).addRejected(WaveCandidate(option, candidate));
		  mObserver->onPatternRejected(archetype, option, candidate);
		}
	    }
	}
    }

    WaveSearchConfiguration mConfig;
    WaveAnalyzer mAnalyzer;
    std::shared_ptr<Executor> mExecutor;
    std::shared_ptr<IWaveSearchObserver> mObserver;
    std::vector<WaveRule> mRules;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_PATTERN_SEARCH_ENGINE_H
