#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "ElliottWaveException.h"
#include "TestUtils.h"
#include "WaveAnalyzer.h"
#include "WaveOptions.h"

using namespace mkc_elliott;

TEST_CASE("Chaining an impulse over bar extrema", "[WaveAnalyzer]")
{
  const PriceSeries series = test::impulseSeries();
  WaveAnalyzer analyzer(series);

  REQUIRE(analyzer.getZigZagThreshold() == DEFAULT_ZIGZAG_THRESHOLD);
  REQUIRE(analyzer.getDefaultStartIndex() == 0);
  REQUIRE(&analyzer.getSeries() == &series);

  auto pattern = analyzer.findImpulsiveWave(0, WaveOption({ 0, 0, 0, 0, 0 }));
  REQUIRE(pattern);
  REQUIRE(pattern->isImpulsive());

  const std::vector<std::size_t> turns = { 0, 4, 6, 12, 15, 19 };
  for (std::size_t i = 0; i < pattern->getNumWaves(); ++i)
    {
      const MonoWave& wave = pattern->getWaves()[i];
      REQUIRE(wave.getIdxStart() == turns[i]);
      REQUIRE(wave.getIdxEnd() == turns[i + 1]);
      REQUIRE(wave.isUp() == (i % 2 == 0));
      REQUIRE(wave.getSkipCount() == 0);
    }

  const std::vector<double> values = { 99.0, 131.0, 114.0, 171.0, 149.0, 186.0 };
  REQUIRE(pattern->values() == values);

  SECTION("Skipping a reversal stretches the wave")
  {
    // Wave 3 runs through the wave 4 dip to the wave 5 high
    auto stretched = analyzer.findImpulsiveWave(0, WaveOption({ 0, 0, 1, 0, 0 }));
    REQUIRE(stretched);
    REQUIRE(stretched->getWave("wave3").getIdxEnd() == 19);
    REQUIRE(stretched->getWave("wave3").getSkipCount() == 1);
    REQUIRE(stretched->getWave("wave4").getIdxStart() == 19);
  }

  SECTION("An unresolvable link fails the whole chain")
  {
    REQUIRE_FALSE(analyzer.findImpulsiveWave(0, WaveOption({ 0, 0, 0, 0, 5 })));
    REQUIRE_FALSE(analyzer.findImpulsiveWave(33, WaveOption({ 0, 0, 0, 0, 0 })));
  }

  SECTION("Same input, same output")
  {
    auto again = analyzer.findImpulsiveWave(0, WaveOption({ 0, 0, 0, 0, 0 }));
    REQUIRE(again);
    REQUIRE(*again == *pattern);
  }
}

TEST_CASE("Chaining a correction", "[WaveAnalyzer]")
{
  const PriceSeries series = test::impulseSeries();
  WaveAnalyzer analyzer(series);

  auto correction = analyzer.findCorrectiveWave(19, WaveOption({ 0, 0, 0 }));
  REQUIRE(correction);
  REQUIRE_FALSE(correction->isImpulsive());
  REQUIRE(correction->getIdxStart() == 19);
  REQUIRE(correction->getIdxEnd() == 29);
  REQUIRE_FALSE(correction->getWave("wave1").isUp());
  REQUIRE(correction->getWave("wave2").isUp());

  const std::vector<double> values = { 186.0, 159.0, 173.0, 149.0 };
  REQUIRE(correction->values() == values);

  SECTION("A rising first leg")
  {
    auto upFirst = analyzer.findCorrectiveWave(0, WaveOption({ 0, 0, 0 }), WaveDirection::Up);
    REQUIRE(upFirst);
    REQUIRE(upFirst->getWave("wave1").isUp());
    REQUIRE(upFirst->getIdxEnd() == 12);
  }
}

TEST_CASE("Chaining an impulse over zig-zag pivots", "[WaveAnalyzer]")
{
  const PriceSeries series = test::impulseSeries();
  WaveAnalyzer analyzer(series, 0.05);

  REQUIRE(analyzer.getPivots().size() == 10);

  auto fromPivots = analyzer.findImpulsiveWaveZigzag(0, WaveOption({ 0, 0, 0, 0, 0 }));
  auto fromBars = analyzer.findImpulsiveWave(0, WaveOption({ 0, 0, 0, 0, 0 }));
  REQUIRE(fromPivots);
  REQUIRE(fromBars);
  REQUIRE(*fromPivots == *fromBars);

  SECTION("The chain starts at the next low pivot")
  {
    auto later = analyzer.findImpulsiveWaveZigzag(1, WaveOption({ 0, 0, 0, 0, 0 }));
    REQUIRE(later);
    REQUIRE(later->getIdxStart() == 6);
  }

  SECTION("No low pivot left")
  {
    REQUIRE_FALSE(analyzer.findImpulsiveWaveZigzag(30, WaveOption({ 0, 0, 0, 0, 0 })));
  }
}

TEST_CASE("WaveAnalyzer argument checks", "[WaveAnalyzer]")
{
  const PriceSeries series = test::impulseSeries();
  WaveAnalyzer analyzer(series);

  REQUIRE_THROWS_AS(analyzer.findImpulsiveWave(34, WaveOption({ 0, 0, 0, 0, 0 })),
		    InvalidConfigurationException);
  REQUIRE_THROWS_AS(analyzer.findImpulsiveWave(0, WaveOption({ 0, 0, 0 })),
		    InvalidConfigurationException);
  REQUIRE_THROWS_AS(analyzer.findCorrectiveWave(0, WaveOption({ 0, 0, 0, 0, 0 })),
		    InvalidConfigurationException);
  REQUIRE_THROWS_AS(analyzer.findImpulsiveWaveZigzag(0, WaveOption({ 0 })),
		    InvalidConfigurationException);

  const PriceSeries empty("EMPTY");
  REQUIRE_THROWS_AS(WaveAnalyzer(empty), InvalidConfigurationException);
  REQUIRE_THROWS_AS(WaveAnalyzer(series, 1.5), InvalidConfigurationException);
}
