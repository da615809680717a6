// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WaveSearchConfigurationFileReader.h"
#include <type_traits>
#include <typeinfo>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace mkc_elliott
{
  template <class T>
  static T tryCast(const std::string& field, const std::string& inputString)
  {
    const std::string trimmed = boost::algorithm::trim_copy(inputString);

    // lexical_cast wraps negative input for unsigned targets
    if (std::is_unsigned<T>::value && !trimmed.empty() && trimmed[0] == '-')
      throw WaveSearchConfigurationFileReaderException("Negative " + field + " value '" + inputString + "'");

    try
      {
	return boost::lexical_cast<T>(trimmed);
      }
    catch (const boost::bad_lexical_cast& e)
      {
	throw WaveSearchConfigurationFileReaderException("Cannot read " + field + " value '" + inputString +
							 "' as " + typeid(T).name() + ": " + e.what());
      }
  }

  std::vector<WaveArchetype> parseArchetypeList(const std::string& list)
  {
    std::vector<std::string> names;
    boost::algorithm::split(names, list, boost::algorithm::is_any_of(";"));

    std::vector<WaveArchetype> archetypes;
    for (auto& name : names)
      {
	boost::algorithm::trim(name);
	if (name.empty())
	  continue;

	archetypes.push_back(archetypeFromString(name));
      }

    return archetypes;
  }

  bool parseFlag(const std::string& value)
  {
    const std::string flag = boost::algorithm::trim_copy(value);

    if (flag == "1" || boost::algorithm::iequals(flag, "true") || boost::algorithm::iequals(flag, "yes"))
      return true;

    if (flag == "0" || boost::algorithm::iequals(flag, "false") || boost::algorithm::iequals(flag, "no"))
      return false;

    throw InvalidArgumentException("Cannot read '" + value + "' as a flag");
  }

  WaveSearchConfigurationFileReader::WaveSearchConfigurationFileReader(const std::string& configFilePath)
    : mConfigFilePath(configFilePath)
  {}

  std::shared_ptr<WaveSearchConfiguration> WaveSearchConfigurationFileReader::readConfigurationFile() const
  {
    boost::filesystem::path configFile(mConfigFilePath);
    if (!boost::filesystem::exists(configFile))
      throw WaveSearchConfigurationFileReaderException("Search configuration file " + configFile.string() +
						       " does not exist");

    std::string skipFrom, skipTo, xyRatio, zigZagThreshold, archetypes;
    std::string useZigZag, searchCorrections, collectRejections, maxSearchMillis;

    try
      {
	io::CSVReader<9, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> csvConfigFile(mConfigFilePath);

	csvConfigFile.read_header(io::ignore_extra_column, "SkipFrom", "SkipTo", "XYRatio", "ZigZagThreshold",
				  "Archetypes", "UseZigZag", "SearchCorrections", "CollectRejections",
				  "MaxSearchMillis");

	if (!csvConfigFile.read_row(skipFrom, skipTo, xyRatio, zigZagThreshold, archetypes,
				    useZigZag, searchCorrections, collectRejections, maxSearchMillis))
	  throw WaveSearchConfigurationFileReaderException("Search configuration file " + mConfigFilePath +
							   " has no data row");
      }
    catch (const io::error::base& e)
      {
	throw WaveSearchConfigurationFileReaderException("Error reading search configuration file " +
							 mConfigFilePath + ": " + e.what());
      }

    return std::make_shared<WaveSearchConfiguration>(tryCast<unsigned int>("SkipFrom", skipFrom),
						     tryCast<unsigned int>("SkipTo", skipTo),
						     tryCast<double>("XYRatio", xyRatio),
						     tryCast<double>("ZigZagThreshold", zigZagThreshold),
						     parseArchetypeList(archetypes),
						     parseFlag(useZigZag),
						     parseFlag(searchCorrections),
						     parseFlag(collectRejections),
						     tryCast<unsigned long>("MaxSearchMillis", maxSearchMillis));
  }
} // namespace mkc_elliott
