#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>
#include "ElliottWaveException.h"
#include "TestUtils.h"
#include "WaveOptions.h"
#include "WavePattern.h"
#include "WaveRule.h"
#include "WaveRuleFactory.h"

using namespace mkc_elliott;

namespace
{
  MonoWave leg(const PriceSeries& series, WaveDirection direction,
	       std::size_t from, std::size_t to, unsigned int skip = 0)
  {
    const auto& dates = series.getDates();
    if (direction == WaveDirection::Up)
      return MonoWave(direction, from, to, series.getLows()[from], from,
		      series.getHighs()[to], to, dates[from], dates[to], skip);

    return MonoWave(direction, from, to, series.getLows()[to], to,
		    series.getHighs()[from], from, dates[from], dates[to], skip);
  }

  std::vector<MonoWave> impulseLegs(const PriceSeries& series, const std::vector<unsigned int>& skips)
  {
    const std::vector<std::size_t> turns = { 0, 4, 6, 12, 15, 19 };
    std::vector<MonoWave> waves;
    for (std::size_t i = 0; i < IMPULSE_WAVE_COUNT; ++i)
      waves.push_back(leg(series, (i % 2 == 0) ? WaveDirection::Up : WaveDirection::Down,
			  turns[i], turns[i + 1], skips[i]));
    return waves;
  }

  std::vector<MonoWave> correctionLegs(const PriceSeries& series)
  {
    return { leg(series, WaveDirection::Down, 19, 23),
	     leg(series, WaveDirection::Up, 23, 25),
	     leg(series, WaveDirection::Down, 25, 29) };
  }
}

TEST_CASE("WavePattern construction", "[WavePattern]")
{
  const PriceSeries series = test::impulseSeries();
  const WavePattern impulse(WavePatternType::Impulsive, impulseLegs(series, { 0, 0, 0, 0, 0 }));

  REQUIRE(impulse.isImpulsive());
  REQUIRE(impulse.getNumWaves() == 5);
  REQUIRE(impulse.getIdxStart() == 0);
  REQUIRE(impulse.getIdxEnd() == 19);
  REQUIRE(impulse.getTotalSkips() == 0);
  REQUIRE(impulse.getWave("wave3").getHigh() == 171.0);
  REQUIRE(impulse.hasWave("wave5"));
  REQUIRE_FALSE(impulse.hasWave("wave6"));
  REQUIRE_FALSE(impulse.hasWave("waveA"));
  REQUIRE_THROWS_AS(impulse.getWave("wave6"), WaveRuleException);

  const std::vector<std::string> keys = { "wave1", "wave2", "wave3", "wave4", "wave5" };
  REQUIRE(impulse.getWaveKeys() == keys);

  SECTION("Plot points")
  {
    const std::vector<double> values = { 99.0, 131.0, 114.0, 171.0, 149.0, 186.0 };
    const std::vector<std::string> labels = { "", "1", "2", "3", "4", "5" };
    REQUIRE(impulse.values() == values);
    REQUIRE(impulse.labels() == labels);

    const auto dates = impulse.dates();
    REQUIRE(dates.size() == 6);
    REQUIRE(dates.front() == series.getDates()[0]);
    REQUIRE(dates.back() == series.getDates()[19]);
  }

  SECTION("Corrective labels")
  {
    const WavePattern correction(WavePatternType::Corrective, correctionLegs(series));
    const std::vector<std::string> labels = { "", "A", "B", "C" };
    const std::vector<double> values = { 186.0, 159.0, 173.0, 149.0 };

    REQUIRE_FALSE(correction.isImpulsive());
    REQUIRE(correction.labels() == labels);
    REQUIRE(correction.values() == values);
  }

  SECTION("Wave count must match the pattern type")
  {
    REQUIRE_THROWS_AS(WavePattern(WavePatternType::Corrective, impulseLegs(series, { 0, 0, 0, 0, 0 })),
		      InvalidConfigurationException);
    REQUIRE_THROWS_AS(WavePattern(WavePatternType::Impulsive, correctionLegs(series)),
		      InvalidConfigurationException);
  }

  SECTION("Waves must be contiguous")
  {
    auto waves = impulseLegs(series, { 0, 0, 0, 0, 0 });
    waves[2] = leg(series, WaveDirection::Up, 7, 12);
    REQUIRE_THROWS_AS(WavePattern(WavePatternType::Impulsive, waves), InvalidConfigurationException);
  }
}

TEST_CASE("Checking a pattern against archetype rules", "[WavePattern]")
{
  const PriceSeries series = test::impulseSeries();
  WavePattern impulse(WavePatternType::Impulsive, impulseLegs(series, { 0, 0, 0, 0, 0 }));

  REQUIRE(impulse.checkRule(WaveRuleFactory::create(WaveArchetype::Impulse)));
  REQUIRE_FALSE(impulse.getViolation());

  REQUIRE(impulse.checkRule(WaveRuleFactory::create(WaveArchetype::Impulse3WaveLongest)));

  REQUIRE_FALSE(impulse.checkRule(WaveRuleFactory::create(WaveArchetype::Impulse1WaveLongest)));
  REQUIRE(impulse.getViolation());
  REQUIRE(*impulse.getViolation() == "Wave1 is not longer (diagonal) than Wave3.");

  REQUIRE_FALSE(impulse.checkRule(WaveRuleFactory::create(WaveArchetype::Impulse5WaveLongest)));
  REQUIRE(*impulse.getViolation() == "Wave5 is not longer (diagonal) than Wave3.");

  REQUIRE_FALSE(impulse.checkRule(WaveRuleFactory::create(WaveArchetype::ExpandingDiagonal)));
  REQUIRE(*impulse.getViolation() == "End of Wave4 does not overlap Wave1.");

  REQUIRE_FALSE(impulse.checkRule(WaveRuleFactory::create(WaveArchetype::ContractingDiagonal)));
  REQUIRE(*impulse.getViolation() == "Wave3 is not shorter (diagonal) than Wave1.");

  SECTION("A later pass clears the violation")
  {
    REQUIRE(impulse.checkRule(WaveRuleFactory::create(WaveArchetype::Impulse)));
    REQUIRE_FALSE(impulse.getViolation());
  }

  SECTION("Correction")
  {
    WavePattern correction(WavePatternType::Corrective, correctionLegs(series));
    REQUIRE(correction.checkRule(WaveRuleFactory::create(WaveArchetype::Correction)));
  }

  SECTION("A rule reading waves the pattern lacks is an error")
  {
    WavePattern correction(WavePatternType::Corrective, correctionLegs(series));
    REQUIRE_THROWS_AS(correction.checkRule(WaveRuleFactory::create(WaveArchetype::Impulse)),
		      WaveRuleException);
  }

  SECTION("Evaluation stops at the first failing condition")
  {
    WaveRule rule("ShortCircuit");
    rule.addCondition("fails", {"wave1", "wave2"},
		      [](const MonoWave&, const MonoWave&) { return false; },
		      "First condition failed.");
    rule.addCondition("throws", {"wave2", "wave3"},
		      [](const MonoWave&, const MonoWave&) -> bool {
			throw std::logic_error("second condition evaluated");
		      },
		      "Second condition failed.");

    REQUIRE_FALSE(impulse.checkRule(rule));
    REQUIRE(*impulse.getViolation() == "First condition failed.");
  }

  SECTION("Predicates receive waves in label order")
  {
    WaveRule rule("Order");
    rule.addCondition("order", {"wave5", "wave1"},
		      [](const MonoWave& first, const MonoWave& second) {
			return first.getIdxEnd() == 19 && second.getIdxStart() == 0;
		      },
		      "Waves passed out of order.");

    REQUIRE(impulse.checkRule(rule));
  }
}

TEST_CASE("Pattern identity ignores how the waves were found", "[WavePattern]")
{
  const PriceSeries series = test::impulseSeries();
  const WavePattern cheap(WavePatternType::Impulsive, impulseLegs(series, { 0, 0, 0, 0, 0 }));
  const WavePattern costly(WavePatternType::Impulsive, impulseLegs(series, { 1, 0, 2, 0, 1 }));

  REQUIRE(costly.getTotalSkips() == 4);
  REQUIRE(cheap == costly);
  REQUIRE(WavePatternHash()(cheap) == WavePatternHash()(costly));

  std::unordered_set<WavePattern, WavePatternHash> seen;
  REQUIRE(seen.insert(cheap).second);
  REQUIRE_FALSE(seen.insert(costly).second);
  REQUIRE(seen.size() == 1);

  SECTION("A different end point is a different pattern")
  {
    auto waves = impulseLegs(series, { 0, 0, 0, 0, 0 });
    waves[4] = leg(series, WaveDirection::Up, 15, 18);
    const WavePattern shorter(WavePatternType::Impulsive, waves);

    REQUIRE(shorter != cheap);
    REQUIRE(seen.insert(shorter).second);
  }
}

TEST_CASE("Collapsing a pattern into one wave of higher degree", "[WavePattern]")
{
  const PriceSeries series = test::impulseSeries();

  const MonoWave up = WavePattern(WavePatternType::Impulsive,
				  impulseLegs(series, { 0, 0, 0, 0, 0 })).toHigherDegreeWave();
  REQUIRE(up.isUp());
  REQUIRE(up.getIdxStart() == 0);
  REQUIRE(up.getIdxEnd() == 19);
  REQUIRE(up.getLow() == 99.0);
  REQUIRE(up.getHigh() == 186.0);
  REQUIRE(up.getDegree() == 2);
  REQUIRE(up.getSkipCount() == 0);

  const MonoWave down = WavePattern(WavePatternType::Corrective, correctionLegs(series)).toHigherDegreeWave();
  REQUIRE_FALSE(down.isUp());
  REQUIRE(down.getIdxStart() == 19);
  REQUIRE(down.getIdxEnd() == 29);
  REQUIRE(down.getHigh() == 186.0);
  REQUIRE(down.getHighIdx() == 19);
  REQUIRE(down.getLow() == 149.0);
  REQUIRE(down.getLowIdx() == 29);
}
