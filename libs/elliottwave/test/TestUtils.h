#ifndef __ELLIOTT_TEST_UTILS_H
#define __ELLIOTT_TEST_UTILS_H 1

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/filesystem.hpp>
#include "PriceSeries.h"

namespace mkc_elliott
{
namespace test
{
  // One daily bar per entry starting 2020-01-01; open and close at the midpoint
  inline PriceSeries makeSeries(const std::vector<double>& lows,
				const std::vector<double>& highs,
				const std::string& symbol = "TEST")
  {
    PriceSeries series(symbol);
    boost::gregorian::date day(2020, boost::gregorian::Jan, 1);

    for (std::size_t i = 0; i < lows.size(); ++i)
      {
	const double mid = (lows[i] + highs[i]) / 2.0;
	series.addBar(OHLCBar(day, mid, highs[i], lows[i], mid));
	day += boost::gregorian::days(1);
      }

    return series;
  }

  // Bars whose midpoint follows straight lines between (index, price) turning
  // points; every bar spans one point either side of its midpoint
  inline PriceSeries makePathSeries(const std::vector<std::pair<std::size_t, double>>& path,
				    const std::string& symbol = "PATH")
  {
    std::vector<double> lows;
    std::vector<double> highs;

    for (std::size_t leg = 0; leg + 1 < path.size(); ++leg)
      {
	const auto& from = path[leg];
	const auto& to = path[leg + 1];
	const double step = (to.second - from.second) / static_cast<double>(to.first - from.first);

	for (std::size_t i = from.first; i < to.first; ++i)
	  {
	    const double mid = from.second + step * static_cast<double>(i - from.first);
	    lows.push_back(mid - 1.0);
	    highs.push_back(mid + 1.0);
	  }
      }

    lows.push_back(path.back().second - 1.0);
    highs.push_back(path.back().second + 1.0);
    return makeSeries(lows, highs, symbol);
  }

  /*
   * Rising five wave impulse 0-4-6-12-15-19 followed by an A-B-C decline
   * 19-23-25-29 and a final rally to bar 33. Bar level extrema sit exactly on
   * the turning points:
   *
   *   wave 1  99 -> 131    wave 2 131 -> 114   wave 3 114 -> 171
   *   wave 4 171 -> 149    wave 5 149 -> 186
   *   wave A 186 -> 159    wave B 159 -> 173   wave C 173 -> 149
   */
  inline PriceSeries impulseSeries()
  {
    return makePathSeries({ {0, 100.0}, {4, 130.0}, {6, 115.0}, {12, 170.0}, {15, 150.0},
			    {19, 185.0}, {23, 160.0}, {25, 172.0}, {29, 150.0}, {33, 190.0} },
			  "IMPULSE");
  }

  // Removes the file when the test scope ends
  class TempFile
  {
  public:
    explicit TempFile(const std::string& extension = ".csv")
      : mPath(boost::filesystem::temp_directory_path() /
	      boost::filesystem::unique_path("elliott-%%%%-%%%%-%%%%" + extension))
    {}

    ~TempFile()
    {
      boost::system::error_code ec;
      boost::filesystem::remove(mPath, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const
    {
      return mPath.string();
    }

  private:
    boost::filesystem::path mPath;
  };
} // namespace test
} // namespace mkc_elliott

#endif // __ELLIOTT_TEST_UTILS_H
