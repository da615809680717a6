// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_EXCEPTION_H
#define __ELLIOTT_WAVE_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_elliott
{
  class ElliottWaveException : public std::runtime_error
  {
  public:
    explicit ElliottWaveException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~ElliottWaveException() = default;
  };

  // Raised for programming or configuration mistakes: bad skip ranges,
  // start indexes outside the series, empty series, wrong tuple arity.
  class InvalidConfigurationException : public ElliottWaveException
  {
  public:
    explicit InvalidConfigurationException(const std::string& msg)
      : ElliottWaveException(msg)
    {}
  };

  class InvalidArgumentException : public InvalidConfigurationException
  {
  public:
    explicit InvalidArgumentException(const std::string& msg)
      : InvalidConfigurationException(msg)
    {}
  };

  // A rule references a wave label the pattern does not have, or a
  // predicate was declared with the wrong arity.
  class WaveRuleException : public InvalidConfigurationException
  {
  public:
    explicit WaveRuleException(const std::string& msg)
      : InvalidConfigurationException(msg)
    {}
  };

  class PriceSeriesException : public ElliottWaveException
  {
  public:
    explicit PriceSeriesException(const std::string& msg)
      : ElliottWaveException(msg)
    {}
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_EXCEPTION_H
