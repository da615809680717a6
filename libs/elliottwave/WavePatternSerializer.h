// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_PATTERN_SERIALIZER_H
#define __ELLIOTT_WAVE_PATTERN_SERIALIZER_H 1

#include <string>
#include <rapidjson/document.h>
#include "MonoWave.h"
#include "PriceSeries.h"
#include "WaveOptions.h"
#include "WavePattern.h"
#include "WaveSearchResult.h"

namespace mkc_elliott
{
  /**
   * @class WavePatternSerializer
   * @brief Exports search results as JSON for an external chart renderer.
   *
   * Every pattern carries its waves and the (dates, values, labels) triple
   * a renderer draws as one polyline over the source bars. Dates use the ISO
   * extended format.
   */
  class WavePatternSerializer
  {
  public:
    static std::string exportToJson(const WaveSearchResult& result, const PriceSeries& series);

    /**
     * @throws ElliottWaveException if the file cannot be written.
     */
    static void saveToFile(const WaveSearchResult& result,
			   const PriceSeries& series,
			   const std::string& filePath);

    static rapidjson::Value serializePattern(const WavePattern& pattern,
					     const WaveOption& option,
					     rapidjson::Document::AllocatorType& allocator);

    static rapidjson::Value serializeWave(const MonoWave& wave,
					  const std::string& label,
					  rapidjson::Document::AllocatorType& allocator);

  private:
    static rapidjson::Value serializeString(const std::string& value,
					    rapidjson::Document::AllocatorType& allocator);
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_PATTERN_SERIALIZER_H
