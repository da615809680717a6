#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "ElliottWaveException.h"
#include "TestUtils.h"
#include "ZigZag.h"

using namespace mkc_elliott;
using mkc_elliott::test::makeSeries;

namespace
{
  std::vector<double> plus(const std::vector<double>& values, double offset)
  {
    std::vector<double> shifted(values);
    for (auto& v : shifted)
      v += offset;
    return shifted;
  }
}

TEST_CASE("Zig-zag pivots alternate and commit on the threshold", "[ZigZag]")
{
  const std::vector<double> lows = { 100, 105, 110, 104, 98, 103, 115, 120 };
  const PriceSeries series = makeSeries(lows, plus(lows, 2.0));

  const auto pivots = detectZigZag(series, 0.1);

  const std::vector<ZigZagPivot> expected = { {0, 100.0, false}, {2, 112.0, true},
					      {4, 98.0, false}, {7, 122.0, true} };
  REQUIRE(pivots == expected);

  SECTION("Pivot types alternate")
  {
    for (std::size_t i = 1; i < pivots.size(); ++i)
      REQUIRE(pivots[i].isHigh != pivots[i - 1].isHigh);
  }

  SECTION("A higher threshold ignores the smaller swing")
  {
    const auto coarse = detectZigZag(series, 0.15);
    const std::vector<ZigZagPivot> expectedCoarse = { {4, 98.0, false}, {7, 122.0, true} };
    REQUIRE(coarse == expectedCoarse);
  }
}

TEST_CASE("Zig-zag extends the open pivot while the trend continues", "[ZigZag]")
{
  SECTION("Falling start moves the seed low")
  {
    const std::vector<double> lows = { 100, 95, 90, 99, 110 };
    const auto pivots = detectZigZag(makeSeries(lows, plus(lows, 1.0)), 0.1);

    REQUIRE(pivots.size() == 2);
    REQUIRE(pivots[0] == ZigZagPivot{2, 90.0, false});
    REQUIRE(pivots[1] == ZigZagPivot{4, 111.0, true});
  }

  SECTION("No move reaches the threshold")
  {
    const std::vector<double> lows = { 100, 101, 102, 101, 100 };
    const auto pivots = detectZigZag(makeSeries(lows, plus(lows, 1.0)), 0.2);

    REQUIRE(pivots.size() == 1);
    REQUIRE_FALSE(pivots[0].isHigh);
  }
}

TEST_CASE("Zig-zag on the impulse fixture lands on every turning point", "[ZigZag]")
{
  const auto pivots = detectZigZag(test::impulseSeries(), 0.05);
  const std::vector<std::size_t> expected = { 0, 4, 6, 12, 15, 19, 23, 25, 29, 33 };

  REQUIRE(pivots.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i)
    {
      REQUIRE(pivots[i].index == expected[i]);
      REQUIRE(pivots[i].isHigh == (i % 2 == 1));
    }
}

TEST_CASE("Zig-zag argument checks", "[ZigZag]")
{
  const std::vector<double> lows = { 100, 105 };
  const PriceSeries series = makeSeries(lows, plus(lows, 2.0));

  REQUIRE_THROWS_AS(detectZigZag(series, 0.0), InvalidConfigurationException);
  REQUIRE_THROWS_AS(detectZigZag(series, 1.0), InvalidConfigurationException);
  REQUIRE_THROWS_AS(detectZigZag(series, -0.1), InvalidConfigurationException);
  REQUIRE(detectZigZag(PriceSeries("EMPTY"), 0.1).empty());
}
