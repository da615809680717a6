// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WavePatternSerializer.h"
#include <fstream>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "ElliottWaveException.h"
#include "WaveRuleFactory.h"

using namespace rapidjson;

namespace mkc_elliott
{
  namespace
  {
    const char* SERIALIZER_VERSION = "1.0";

    std::string isoDate(const ptime& when)
    {
      return boost::posix_time::to_iso_extended_string(when);
    }
  }

  Value WavePatternSerializer::serializeString(const std::string& value,
					       Document::AllocatorType& allocator)
  {
    return Value(value.c_str(), static_cast<SizeType>(value.size()), allocator);
  }

  Value WavePatternSerializer::serializeWave(const MonoWave& wave,
					     const std::string& label,
					     Document::AllocatorType& allocator)
  {
    Value waveValue(kObjectType);
    waveValue.AddMember("label", serializeString(label, allocator), allocator);
    waveValue.AddMember("direction", serializeString(toString(wave.getDirection()), allocator), allocator);
    waveValue.AddMember("idxStart", static_cast<uint64_t>(wave.getIdxStart()), allocator);
    waveValue.AddMember("idxEnd", static_cast<uint64_t>(wave.getIdxEnd()), allocator);
    waveValue.AddMember("low", wave.getLow(), allocator);
    waveValue.AddMember("high", wave.getHigh(), allocator);
    waveValue.AddMember("lowIdx", static_cast<uint64_t>(wave.getLowIdx()), allocator);
    waveValue.AddMember("highIdx", static_cast<uint64_t>(wave.getHighIdx()), allocator);
    waveValue.AddMember("dateStart", serializeString(isoDate(wave.getDateStart()), allocator), allocator);
    waveValue.AddMember("dateEnd", serializeString(isoDate(wave.getDateEnd()), allocator), allocator);
    waveValue.AddMember("skip", wave.getSkipCount(), allocator);
    waveValue.AddMember("degree", wave.getDegree(), allocator);
    return waveValue;
  }

  Value WavePatternSerializer::serializePattern(const WavePattern& pattern,
						const WaveOption& option,
						Document::AllocatorType& allocator)
  {
    Value patternValue(kObjectType);
    patternValue.AddMember("shape", serializeString(toString(pattern.getType()), allocator), allocator);

    Value optionValue(kArrayType);
    for (auto skip : option.getValues())
      optionValue.PushBack(skip, allocator);
    patternValue.AddMember("option", optionValue, allocator);

    patternValue.AddMember("idxStart", static_cast<uint64_t>(pattern.getIdxStart()), allocator);
    patternValue.AddMember("idxEnd", static_cast<uint64_t>(pattern.getIdxEnd()), allocator);

    const auto labels = pattern.labels();
    const auto keys = pattern.getWaveKeys();

    Value waves(kArrayType);
    for (std::size_t i = 0; i < pattern.getNumWaves(); ++i)
      {
	Value waveValue = serializeWave(pattern.getWaves()[i], labels[i + 1], allocator);
	waveValue.AddMember("key", serializeString(keys[i], allocator), allocator);
	waves.PushBack(waveValue, allocator);
      }
    patternValue.AddMember("waves", waves, allocator);

    Value dates(kArrayType);
    for (const auto& date : pattern.dates())
      dates.PushBack(serializeString(isoDate(date), allocator), allocator);
    patternValue.AddMember("dates", dates, allocator);

    Value values(kArrayType);
    for (double value : pattern.values())
      values.PushBack(value, allocator);
    patternValue.AddMember("values", values, allocator);

    Value labelValues(kArrayType);
    for (const auto& label : labels)
      labelValues.PushBack(serializeString(label, allocator), allocator);
    patternValue.AddMember("labels", labelValues, allocator);

    if (pattern.getViolation())
      patternValue.AddMember("violation", serializeString(*pattern.getViolation(), allocator), allocator);

    return patternValue;
  }

  std::string WavePatternSerializer::exportToJson(const WaveSearchResult& result, const PriceSeries& series)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value metadata(kObjectType);
    metadata.AddMember("version", StringRef(SERIALIZER_VERSION), allocator);
    metadata.AddMember("symbol", serializeString(series.getSymbol(), allocator), allocator);
    metadata.AddMember("bars", static_cast<uint64_t>(series.size()), allocator);
    metadata.AddMember("startIndex", static_cast<uint64_t>(result.getStartIndex()), allocator);
    if (result.getStartIndex() < series.size())
      metadata.AddMember("startDate",
			 serializeString(isoDate(series.getDates()[result.getStartIndex()]), allocator),
			 allocator);
    metadata.AddMember("impulseOptionsEvaluated", static_cast<uint64_t>(result.getImpulseOptionsEvaluated()), allocator);
    metadata.AddMember("correctionOptionsEvaluated", static_cast<uint64_t>(result.getCorrectionOptionsEvaluated()), allocator);
    metadata.AddMember("cancelled", result.isCancelled(), allocator);
    doc.AddMember("metadata", metadata, allocator);

    Value archetypes(kArrayType);
    for (const auto& archetypeResult : result.getArchetypeResults())
      {
	Value archetypeValue(kObjectType);
	archetypeValue.AddMember("name", serializeString(toString(archetypeResult.getArchetype()), allocator), allocator);

	Value accepted(kArrayType);
	for (const auto& candidate : archetypeResult.getAccepted())
	  accepted.PushBack(serializePattern(candidate.pattern, candidate.option, allocator), allocator);
	archetypeValue.AddMember("accepted", accepted, allocator);

	Value rejected(kArrayType);
	for (const auto& candidate : archetypeResult.getRejected())
	  rejected.PushBack(serializePattern(candidate.pattern, candidate.option, allocator), allocator);
	archetypeValue.AddMember("rejected", rejected, allocator);

	archetypes.PushBack(archetypeValue, allocator);
      }
    doc.AddMember("archetypes", archetypes, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
  }

  void WavePatternSerializer::saveToFile(const WaveSearchResult& result,
					 const PriceSeries& series,
					 const std::string& filePath)
  {
    const std::string jsonStr = exportToJson(result, series);

    std::ofstream file(filePath);
    if (!file.is_open())
      throw ElliottWaveException("Cannot open " + filePath + " for writing");

    file << jsonStr;
    if (!file)
      throw ElliottWaveException("Error writing " + filePath);
  }
} // namespace mkc_elliott
