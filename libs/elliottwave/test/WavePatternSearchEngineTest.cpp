#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>
#include "ElliottWaveException.h"
#include "ParallelExecutors.h"
#include "StreamWaveSearchObserver.h"
#include "TestUtils.h"
#include "WavePatternSearchEngine.h"

using namespace mkc_elliott;
using concurrency::SingleThreadExecutor;
using concurrency::ThreadPoolExecutor;

namespace
{
  struct PhaseRecord
  {
    WavePatternType shape;
    std::size_t idxStart;
    std::uint64_t numOptions;
    std::uint64_t evaluated;
    bool cancelled;
  };

  class RecordingObserver : public IWaveSearchObserver
  {
  public:
    void onPhaseStarted(WavePatternType shape, std::size_t idxStart, std::uint64_t numOptions) override
    {
      threads.push_back(std::this_thread::get_id());
      phases.push_back(PhaseRecord{shape, idxStart, numOptions, 0, false});
    }

    void onPatternAccepted(WaveArchetype archetype, const WaveOption& option, const WavePattern&) override
    {
      threads.push_back(std::this_thread::get_id());
      accepted.push_back(std::make_pair(archetype, option));
    }

    void onPatternRejected(WaveArchetype, const WaveOption&, const WavePattern&) override
    {
      threads.push_back(std::this_thread::get_id());
      ++rejected;
    }

    void onPhaseFinished(WavePatternType, std::size_t, std::uint64_t evaluated, bool cancelled) override
    {
      threads.push_back(std::this_thread::get_id());
      phases.back().evaluated = evaluated;
      phases.back().cancelled = cancelled;
    }

    std::vector<PhaseRecord> phases;
    std::vector<std::pair<WaveArchetype, WaveOption>> accepted;
    std::size_t rejected = 0;
    std::vector<std::thread::id> threads;
  };

  WaveSearchConfiguration makeConfig(unsigned int skipTo,
				     const std::vector<WaveArchetype>& archetypes,
				     bool collectRejections = false,
				     bool searchCorrections = true,
				     bool useZigZag = false)
  {
    return WaveSearchConfiguration(0, skipTo, DEFAULT_XY_RATIO, DEFAULT_ZIGZAG_THRESHOLD, archetypes,
				   useZigZag, searchCorrections, collectRejections, 0);
  }

  bool isContiguous(const WavePattern& pattern)
  {
    const auto& waves = pattern.getWaves();
    for (std::size_t i = 1; i < waves.size(); ++i)
      {
	if (waves[i].getIdxStart() != waves[i - 1].getIdxEnd() ||
	    waves[i].getDirection() == waves[i - 1].getDirection())
	  return false;
      }
    return true;
  }

  void requireSameCandidates(const std::vector<WaveCandidate>& lhs, const std::vector<WaveCandidate>& rhs)
  {
    REQUIRE(lhs.size() == rhs.size());
    for (std::size_t i = 0; i < lhs.size(); ++i)
      {
	REQUIRE(lhs[i].option == rhs[i].option);
	REQUIRE(lhs[i].pattern == rhs[i].pattern);
	REQUIRE(lhs[i].pattern.getViolation() == rhs[i].pattern.getViolation());
      }
  }
}

TEST_CASE("Impulses followed by corrections", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const auto config = makeConfig(1, { WaveArchetype::Impulse3WaveLongest,
				      WaveArchetype::Impulse1WaveLongest,
				      WaveArchetype::Correction }, true);
  WavePatternSearchEngine<> engine(series, config);

  const WaveSearchResult result = engine.run();

  REQUIRE(result.getStartIndex() == 0);
  REQUIRE_FALSE(result.isCancelled());
  REQUIRE(result.getImpulseOptionsEvaluated() == 32);
  REQUIRE(result.getCorrectionOptionsEvaluated() == 8 * result.getCorrectionStarts().size());

  const auto& impulses = result.getResult(WaveArchetype::Impulse3WaveLongest).getAccepted();
  REQUIRE_FALSE(impulses.empty());
  REQUIRE(impulses.front().option == WaveOption({ 0, 0, 0, 0, 0 }));
  REQUIRE(impulses.front().pattern.getIdxStart() == 0);
  REQUIRE(impulses.front().pattern.getIdxEnd() == 19);

  SECTION("Accepted candidates are contiguous, clean and distinct")
  {
    for (const auto& archetypeResult : result.getArchetypeResults())
      {
	std::unordered_set<WavePattern, WavePatternHash> seen;
	for (const auto& candidate : archetypeResult.getAccepted())
	  {
	    REQUIRE(isContiguous(candidate.pattern));
	    REQUIRE_FALSE(candidate.pattern.getViolation());
	    REQUIRE(seen.insert(candidate.pattern).second);
	  }
      }
  }

  SECTION("Candidates are reported in option order")
  {
    for (const auto& archetypeResult : result.getArchetypeResults())
      {
	const auto& accepted = archetypeResult.getAccepted();
	if (archetypeResult.getArchetype() == WaveArchetype::Correction)
	  continue;

	for (std::size_t i = 1; i < accepted.size(); ++i)
	  REQUIRE(accepted[i - 1].option < accepted[i].option);
      }
  }

  SECTION("Rejections carry the failing condition")
  {
    const auto& rejected = result.getResult(WaveArchetype::Impulse1WaveLongest).getRejected();
    REQUIRE_FALSE(rejected.empty());
    REQUIRE(rejected.front().option == WaveOption({ 0, 0, 0, 0, 0 }));
    REQUIRE(rejected.front().pattern.getViolation());
    REQUIRE(*rejected.front().pattern.getViolation() == "Wave1 is not longer (diagonal) than Wave3.");

    for (const auto& candidate : rejected)
      REQUIRE(candidate.pattern.getViolation());
  }

  SECTION("Corrections start where accepted impulses end")
  {
    const auto& starts = result.getCorrectionStarts();
    REQUIRE(std::find(starts.begin(), starts.end(), 19u) != starts.end());

    const auto& corrections = result.getResult(WaveArchetype::Correction).getAccepted();
    const auto fromWave5 = std::find_if(corrections.begin(), corrections.end(),
					[](const WaveCandidate& c) { return c.pattern.getIdxStart() == 19; });
    REQUIRE(fromWave5 != corrections.end());
    REQUIRE(fromWave5->option == WaveOption({ 0, 0, 0 }));
    REQUIRE(fromWave5->pattern.getIdxEnd() == 29);

    for (const auto& candidate : corrections)
      REQUIRE(std::find(starts.begin(), starts.end(), candidate.pattern.getIdxStart()) != starts.end());
  }

  SECTION("Totals")
  {
    std::size_t accepted = 0;
    for (const auto& archetypeResult : result.getArchetypeResults())
      accepted += archetypeResult.getAccepted().size();
    REQUIRE(result.getNumAccepted() == accepted);
    REQUIRE(result.getNumRejected() > 0);
    REQUIRE_THROWS_AS(result.getResult(WaveArchetype::TDWave), InvalidArgumentException);
  }
}

TEST_CASE("A pattern is reported under the first archetype that accepts it", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const WaveOption zeros({ 0, 0, 0, 0, 0 });

  auto claimedBy = [&zeros](const WaveSearchResult& result, WaveArchetype archetype) {
    const auto& accepted = result.getResult(archetype).getAccepted();
    return std::any_of(accepted.begin(), accepted.end(),
		       [&zeros](const WaveCandidate& c) { return c.option == zeros; });
  };

  auto requireDisjoint = [](const WaveSearchResult& result) {
    std::unordered_set<WavePattern, WavePatternHash> seen;
    for (const auto& archetypeResult : result.getArchetypeResults())
      for (const auto& candidate : archetypeResult.getAccepted())
	REQUIRE(seen.insert(candidate.pattern).second);
  };

  SECTION("Impulse first")
  {
    WavePatternSearchEngine<> engine(series, makeConfig(1, { WaveArchetype::Impulse,
							     WaveArchetype::Impulse3WaveLongest }));
    const WaveSearchResult result = engine.run(0);

    REQUIRE(claimedBy(result, WaveArchetype::Impulse));
    REQUIRE_FALSE(claimedBy(result, WaveArchetype::Impulse3WaveLongest));
    requireDisjoint(result);
  }

  SECTION("Impulse3WaveLongest first")
  {
    WavePatternSearchEngine<> engine(series, makeConfig(1, { WaveArchetype::Impulse3WaveLongest,
							     WaveArchetype::Impulse }));
    const WaveSearchResult result = engine.run(0);

    REQUIRE(claimedBy(result, WaveArchetype::Impulse3WaveLongest));
    REQUIRE_FALSE(claimedBy(result, WaveArchetype::Impulse));
    requireDisjoint(result);
  }
}

TEST_CASE("Repeated archetypes do not duplicate accepted patterns", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const auto config = makeConfig(1, { WaveArchetype::Correction, WaveArchetype::Impulse,
				      WaveArchetype::Correction }, false, false);
  REQUIRE(config.getArchetypes().size() == 2);

  WavePatternSearchEngine<> engine(series, config);
  const WaveSearchResult result = engine.run(19);

  REQUIRE(result.getArchetypeResults().size() == 2);

  const auto& corrections = result.getResult(WaveArchetype::Correction).getAccepted();
  REQUIRE_FALSE(corrections.empty());

  std::unordered_set<WavePattern, WavePatternHash> seen;
  for (const auto& archetypeResult : result.getArchetypeResults())
    for (const auto& candidate : archetypeResult.getAccepted())
      REQUIRE(seen.insert(candidate.pattern).second);
}

TEST_CASE("The executor does not change the result", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const auto config = makeConfig(2, WaveRuleFactory::allArchetypes(), true);

  WavePatternSearchEngine<SingleThreadExecutor> serial(series, config);
  WavePatternSearchEngine<ThreadPoolExecutor<4>> parallel(series, config);

  const WaveSearchResult expected = serial.run(0);
  const WaveSearchResult actual = parallel.run(0);

  REQUIRE(actual.getImpulseOptionsEvaluated() == expected.getImpulseOptionsEvaluated());
  REQUIRE(actual.getCorrectionOptionsEvaluated() == expected.getCorrectionOptionsEvaluated());
  REQUIRE(actual.getCorrectionStarts() == expected.getCorrectionStarts());
  REQUIRE(actual.getNumAccepted() == expected.getNumAccepted());
  REQUIRE(expected.getNumAccepted() > 0);

  for (auto archetype : config.getArchetypes())
    {
      requireSameCandidates(actual.getResult(archetype).getAccepted(),
			    expected.getResult(archetype).getAccepted());
      requireSameCandidates(actual.getResult(archetype).getRejected(),
			    expected.getResult(archetype).getRejected());
    }
}

TEST_CASE("Observer sees every phase on the calling thread", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const auto config = makeConfig(1, { WaveArchetype::Impulse3WaveLongest, WaveArchetype::Correction });
  auto observer = std::make_shared<RecordingObserver>();
  auto executor = std::make_shared<ThreadPoolExecutor<2>>();

  WavePatternSearchEngine<ThreadPoolExecutor<2>> engine(series, config, executor, observer);
  const WaveSearchResult result = engine.run(0);

  REQUIRE(observer->phases.size() == 1 + result.getCorrectionStarts().size());
  REQUIRE(observer->phases.front().shape == WavePatternType::Impulsive);
  REQUIRE(observer->phases.front().idxStart == 0);
  REQUIRE(observer->phases.front().numOptions == 32);
  REQUIRE(observer->phases.front().evaluated == 32);
  REQUIRE_FALSE(observer->phases.front().cancelled);

  for (std::size_t i = 1; i < observer->phases.size(); ++i)
    {
      REQUIRE(observer->phases[i].shape == WavePatternType::Corrective);
      REQUIRE(observer->phases[i].idxStart == result.getCorrectionStarts()[i - 1]);
      REQUIRE(observer->phases[i].numOptions == 8);
    }

  REQUIRE(observer->accepted.size() == result.getNumAccepted());
  REQUIRE(observer->rejected == 0);

  const auto caller = std::this_thread::get_id();
  for (const auto& id : observer->threads)
    REQUIRE(id == caller);
}

TEST_CASE("Stream observer prints accepted patterns", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const auto config = makeConfig(0, { WaveArchetype::Impulse3WaveLongest, WaveArchetype::Impulse1WaveLongest },
				 true);
  std::ostringstream quiet;
  std::ostringstream verbose;

  WavePatternSearchEngine<> quietEngine(series, config, std::make_shared<StreamWaveSearchObserver>(quiet));
  WavePatternSearchEngine<> verboseEngine(series, config,
					  std::make_shared<StreamWaveSearchObserver>(verbose, true));
  quietEngine.run(0);
  verboseEngine.run(0);

  REQUIRE(quiet.str().find("Impulse3WaveLongest found with [0, 0, 0, 0, 0]") != std::string::npos);
  REQUIRE(quiet.str().find("rejected") == std::string::npos);
  REQUIRE(verbose.str().find("Impulse1WaveLongest rejected [0, 0, 0, 0, 0]: "
			     "Wave1 is not longer (diagonal) than Wave3.") != std::string::npos);
  REQUIRE(verbose.str().find("Finished Impulsive search from bar 0 after 1 combinations") != std::string::npos);
}

TEST_CASE("Search variants", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();

  SECTION("Corrections from the start bar")
  {
    const auto config = makeConfig(1, { WaveArchetype::Correction }, false, false);
    WavePatternSearchEngine<> engine(series, config);
    const WaveSearchResult result = engine.run(19);

    REQUIRE(result.getImpulseOptionsEvaluated() == 0);
    REQUIRE(result.getCorrectionOptionsEvaluated() == 8);
    REQUIRE(result.getCorrectionStarts() == std::vector<std::size_t>{ 19 });

    const auto& accepted = result.getResult(WaveArchetype::Correction).getAccepted();
    REQUIRE_FALSE(accepted.empty());
    REQUIRE(accepted.front().option == WaveOption({ 0, 0, 0 }));
    REQUIRE(accepted.front().pattern.getIdxEnd() == 29);
  }

  SECTION("Corrections alone still start at the start bar when they follow impulses")
  {
    const auto config = makeConfig(0, { WaveArchetype::Correction });
    WavePatternSearchEngine<> engine(series, config);
    const WaveSearchResult result = engine.run(19);

    REQUIRE(result.getCorrectionStarts() == std::vector<std::size_t>{ 19 });
  }

  SECTION("Zig-zag pivots")
  {
    const auto config = makeConfig(1, { WaveArchetype::Impulse3WaveLongest }, false, true, true);
    WavePatternSearchEngine<> zigzag(series, config);
    WavePatternSearchEngine<> bars(series, makeConfig(0, { WaveArchetype::Impulse3WaveLongest }));

    const auto fromPivots = zigzag.run(0).getResult(WaveArchetype::Impulse3WaveLongest).getAccepted();
    const auto fromBars = bars.run(0).getResult(WaveArchetype::Impulse3WaveLongest).getAccepted();

    REQUIRE_FALSE(fromPivots.empty());
    REQUIRE(fromBars.size() == 1);
    REQUIRE(fromPivots.front().pattern == fromBars.front().pattern);
  }

  SECTION("Configured time limit of zero means unbounded")
  {
    WavePatternSearchEngine<> engine(series, makeConfig(1, { WaveArchetype::Impulse }));
    REQUIRE_FALSE(engine.run(0).isCancelled());
  }
}

TEST_CASE("Cancelled searches report what was evaluated", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const auto config = makeConfig(1, { WaveArchetype::Impulse3WaveLongest, WaveArchetype::Correction });
  auto observer = std::make_shared<RecordingObserver>();
  WavePatternSearchEngine<> engine(series, config, observer);

  SECTION("Cancelled before the start")
  {
    SearchCancellation cancellation;
    cancellation.cancel();

    const WaveSearchResult result = engine.run(0, cancellation);
    REQUIRE(result.isCancelled());
    REQUIRE(result.getImpulseOptionsEvaluated() == 0);
    REQUIRE(result.getCorrectionOptionsEvaluated() == 0);
    REQUIRE(result.getNumAccepted() == 0);
    REQUIRE(result.getCorrectionStarts().empty());

    REQUIRE(observer->phases.size() == 1);
    REQUIRE(observer->phases.front().cancelled);
    REQUIRE(observer->phases.front().evaluated == 0);
  }

  SECTION("Deadline already passed")
  {
    SearchCancellation cancellation;
    cancellation.setDeadline(SearchCancellation::Clock::now() - std::chrono::seconds(1));
    REQUIRE(cancellation.hasDeadline());

    const WaveSearchResult result = engine.run(0, cancellation);
    REQUIRE(result.isCancelled());
    REQUIRE(result.getImpulseOptionsEvaluated() == 0);
  }

  SECTION("A generous deadline does not interfere")
  {
    SearchCancellation cancellation(std::chrono::milliseconds(60000));
    const WaveSearchResult result = engine.run(0, cancellation);
    REQUIRE_FALSE(result.isCancelled());
    REQUIRE(result.getImpulseOptionsEvaluated() == 32);
  }
}

TEST_CASE("WavePatternSearchEngine argument checks", "[WavePatternSearchEngine]")
{
  const PriceSeries series = test::impulseSeries();
  const auto config = makeConfig(0, { WaveArchetype::Impulse });

  WavePatternSearchEngine<> engine(series, config);
  REQUIRE_THROWS_AS(engine.run(series.size()), InvalidConfigurationException);

  REQUIRE_THROWS_AS(WavePatternSearchEngine<>(series, config, std::shared_ptr<IWaveSearchObserver>()),
		    InvalidConfigurationException);
  REQUIRE_THROWS_AS(WavePatternSearchEngine<>(series, config, std::shared_ptr<SingleThreadExecutor>(),
					      std::make_shared<NullWaveSearchObserver>()),
		    InvalidConfigurationException);
  REQUIRE_THROWS_AS(WavePatternSearchEngine<>(PriceSeries("EMPTY"), config), InvalidConfigurationException);
}
