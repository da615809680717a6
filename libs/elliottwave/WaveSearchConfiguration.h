// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_SEARCH_CONFIGURATION_H
#define __ELLIOTT_WAVE_SEARCH_CONFIGURATION_H 1

#include <algorithm>
#include <cmath>
#include <ostream>
#include <string>
#include <vector>
#include "ElliottWaveException.h"
#include "WaveAnalyzer.h"
#include "WaveRule.h"
#include "WaveRuleFactory.h"

namespace mkc_elliott
{
  /**
   * @class WaveSearchConfiguration
   * @brief Parameters of one search run, validated on construction.
   *
   * A maximum search time of zero means the search is not time bounded.
   */
  class WaveSearchConfiguration
  {
  public:
    static constexpr unsigned int DEFAULT_SKIP_FROM = 0;
    static constexpr unsigned int DEFAULT_SKIP_TO = 5;

    WaveSearchConfiguration()
      : WaveSearchConfiguration(DEFAULT_SKIP_FROM, DEFAULT_SKIP_TO,
				DEFAULT_XY_RATIO, DEFAULT_ZIGZAG_THRESHOLD,
				WaveRuleFactory::defaultArchetypes(),
				false, true, false, 0)
    {}

    /**
     * @throws InvalidConfigurationException if skipTo < skipFrom, the x/y
     *         ratio is not positive, the zig-zag threshold is not in (0, 1)
     *         or no archetype is selected.
     */
    WaveSearchConfiguration(unsigned int skipFrom,
			    unsigned int skipTo,
			    double xyRatio,
			    double zigZagThreshold,
			    const std::vector<WaveArchetype>& archetypes,
			    bool useZigZag,
			    bool searchCorrections,
			    bool collectRejections,
			    unsigned long maxSearchMillis)
      : mSkipFrom(skipFrom),
	mSkipTo(skipTo),
	mXYRatio(xyRatio),
	mZigZagThreshold(zigZagThreshold),
	mArchetypes(),
	mUseZigZag(useZigZag),
	mSearchCorrections(searchCorrections),
	mCollectRejections(collectRejections),
	mMaxSearchMillis(maxSearchMillis)
    {
      if (mSkipTo < mSkipFrom)
	throw InvalidConfigurationException("WaveSearchConfiguration: skip range upper bound " +
					    std::to_string(mSkipTo) + " is below lower bound " +
					    std::to_string(mSkipFrom));

      if (!(mXYRatio > 0.0) || !std::isfinite(mXYRatio))
	throw InvalidConfigurationException("WaveSearchConfiguration: x/y ratio must be positive, got " +
					    std::to_string(mXYRatio));

      if (!(mZigZagThreshold > 0.0 && mZigZagThreshold < 1.0))
	throw InvalidConfigurationException("WaveSearchConfiguration: zig-zag threshold must be in (0, 1), got " +
					    std::to_string(mZigZagThreshold));

      // Repeated archetypes are searched once, in order of first mention
      for (auto archetype : archetypes)
	{
	  if (std::find(mArchetypes.begin(), mArchetypes.end(), archetype) == mArchetypes.end())
	    mArchetypes.push_back(archetype);
	}

      if (mArchetypes.empty())
	throw InvalidConfigurationException("WaveSearchConfiguration: no wave archetype selected");
    }

    unsigned int getSkipFrom() const
    {
      return mSkipFrom;
    }

    unsigned int getSkipTo() const
    {
      return mSkipTo;
    }

    double getXYRatio() const
    {
      return mXYRatio;
    }

    double getZigZagThreshold() const
    {
      return mZigZagThreshold;
    }

    const std::vector<WaveArchetype>& getArchetypes() const
    {
      return mArchetypes;
    }

    bool useZigZag() const
    {
      return mUseZigZag;
    }

    bool searchCorrections() const
    {
      return mSearchCorrections;
    }

    bool collectRejections() const
    {
      return mCollectRejections;
    }

    unsigned long getMaxSearchMillis() const
    {
      return mMaxSearchMillis;
    }

  private:
    unsigned int mSkipFrom;
    unsigned int mSkipTo;
    double mXYRatio;
    double mZigZagThreshold;
    std::vector<WaveArchetype> mArchetypes;
    bool mUseZigZag;
    bool mSearchCorrections;
    bool mCollectRejections;
    unsigned long mMaxSearchMillis;
  };

  inline std::ostream& operator<<(std::ostream& os, const WaveSearchConfiguration& config)
  {
    os << "Skip range: [" << config.getSkipFrom() << ", " << config.getSkipTo() << "]" << std::endl;
    os << "X/Y ratio: " << config.getXYRatio() << std::endl;
    os << "Zig-zag: " << (config.useZigZag() ? "on" : "off")
       << " (threshold " << config.getZigZagThreshold() << ")" << std::endl;
    os << "Archetypes:";
    for (auto archetype : config.getArchetypes())
      os << " " << toString(archetype);
    os << std::endl;
    os << "Corrections after impulses: " << (config.searchCorrections() ? "yes" : "no") << std::endl;
    os << "Collect rejections: " << (config.collectRejections() ? "yes" : "no") << std::endl;
    if (config.getMaxSearchMillis() > 0)
      os << "Time limit: " << config.getMaxSearchMillis() << " ms" << std::endl;
    return os;
  }
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_SEARCH_CONFIGURATION_H
