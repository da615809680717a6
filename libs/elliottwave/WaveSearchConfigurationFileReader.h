// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_SEARCH_CONFIGURATION_FILE_READER_H
#define __ELLIOTT_WAVE_SEARCH_CONFIGURATION_FILE_READER_H 1

#include <memory>
#include <string>
#include <vector>
#include "ElliottWaveException.h"
#include "WaveRuleFactory.h"
#include "WaveSearchConfiguration.h"

namespace mkc_elliott
{
  class WaveSearchConfigurationFileReaderException : public InvalidConfigurationException
  {
  public:
    explicit WaveSearchConfigurationFileReaderException(const std::string& msg)
      : InvalidConfigurationException(msg)
    {}

    ~WaveSearchConfigurationFileReaderException()
    {}
  };

  /**
   * @brief Reads a search configuration from the first data row of a CSV
   * file with the header
   *
   *   SkipFrom,SkipTo,XYRatio,ZigZagThreshold,Archetypes,UseZigZag,
   *   SearchCorrections,CollectRejections,MaxSearchMillis
   *
   * Archetypes is a ';' separated list of archetype names. The boolean
   * columns accept 1/0, true/false and yes/no. Columns other than these are
   * ignored.
   */
  class WaveSearchConfigurationFileReader
  {
  public:
    explicit WaveSearchConfigurationFileReader(const std::string& configFilePath);

    /**
     * @throws WaveSearchConfigurationFileReaderException if the file is
     *         missing, malformed or has no data row.
     * @throws InvalidConfigurationException if the values read do not form a
     *         valid configuration.
     */
    std::shared_ptr<WaveSearchConfiguration> readConfigurationFile() const;

    const std::string& getConfigFilePath() const
    {
      return mConfigFilePath;
    }

  private:
    std::string mConfigFilePath;
  };

  // ';' separated archetype names, blanks around names are ignored
  std::vector<WaveArchetype> parseArchetypeList(const std::string& list);

  // 1/0, true/false, yes/no (case insensitive)
  bool parseFlag(const std::string& value);
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_SEARCH_CONFIGURATION_FILE_READER_H
