// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WaveOptions.h"
#include <algorithm>
#include <numeric>
#include <sstream>
#include "ElliottWaveException.h"

namespace mkc_elliott
{
  WaveOption::WaveOption(const std::vector<unsigned int>& values)
    : mValues(values),
      mSum(std::accumulate(values.begin(), values.end(), 0UL))
  {}

  std::string WaveOption::toString() const
  {
    std::ostringstream os;
    os << *this;
    return os.str();
  }

  bool operator<(const WaveOption& lhs, const WaveOption& rhs)
  {
    if (lhs.getSum() != rhs.getSum())
      return lhs.getSum() < rhs.getSum();

    return lhs.getValues() < rhs.getValues();
  }

  bool operator==(const WaveOption& lhs, const WaveOption& rhs)
  {
    return lhs.getValues() == rhs.getValues();
  }

  bool operator!=(const WaveOption& lhs, const WaveOption& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const WaveOption& option)
  {
    os << "[";
    for (std::size_t i = 0; i < option.size(); ++i)
      {
	if (i > 0)
	  os << ", ";
	os << option[i];
      }
    os << "]";
    return os;
  }

  WaveOptionsGenerator::WaveOptionsGenerator(std::size_t numSlots, unsigned int from, unsigned int to)
    : mNumSlots(numSlots),
      mFrom(from),
      mTo(to),
      mOptions()
  {
    if (numSlots == 0)
      throw InvalidConfigurationException("WaveOptionsGenerator: number of slots must be positive");

    setRange(from, to);
    populate();
  }

  void WaveOptionsGenerator::setRange(unsigned int from, unsigned int to)
  {
    if (to < from)
      throw InvalidConfigurationException("WaveOptionsGenerator: upper skip bound " + std::to_string(to) +
					  " is below lower bound " + std::to_string(from));

    mFrom = from;
    mTo = to;
  }

  std::uint64_t WaveOptionsGenerator::getNumberOfOptions() const
  {
    const std::uint64_t base = static_cast<std::uint64_t>(mTo - mFrom) + 1;
    std::uint64_t count = 1;

    for (std::size_t i = 0; i < mNumSlots; ++i)
      {
	if (count > MAX_OPTIONS)
	  break;
	count *= base;
      }

    return count;
  }

  void WaveOptionsGenerator::populate()
  {
    const std::uint64_t count = getNumberOfOptions();
    if (count > MAX_OPTIONS)
      throw InvalidConfigurationException("WaveOptionsGenerator: skip range [" + std::to_string(mFrom) +
					  ", " + std::to_string(mTo) + "] over " +
					  std::to_string(mNumSlots) + " slots is too large to enumerate");

    mOptions.clear();
    mOptions.reserve(static_cast<std::size_t>(count));

    // Odometer over all slots, the last slot turning fastest
    std::vector<unsigned int> current(mNumSlots, mFrom);
    for (;;)
      {
	mOptions.emplace_back(current);

	std::size_t slot = mNumSlots;
	while (slot > 0)
	  {
	    --slot;
	    if (current[slot] < mTo)
	      {
		++current[slot];
		break;
	      }
	    current[slot] = mFrom;
	    if (slot == 0)
	      {
		std::sort(mOptions.begin(), mOptions.end());
		return;
	      }
	  }
      }
  }
} // namespace mkc_elliott
