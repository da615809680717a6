// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_WAVE_OPTIONS_H
#define __ELLIOTT_WAVE_OPTIONS_H 1

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace mkc_elliott
{
  constexpr std::size_t IMPULSE_WAVE_COUNT = 5;
  constexpr std::size_t CORRECTIVE_WAVE_COUNT = 3;

  /**
   * @class WaveOption
   * @brief One skip count per monowave slot of a pattern.
   *
   * Options order by the sum of their skip counts first, so the most
   * literal segmentations come first, and lexicographically on ties.
   */
  class WaveOption
  {
  public:
    explicit WaveOption(const std::vector<unsigned int>& values);

    const std::vector<unsigned int>& getValues() const
    {
      return mValues;
    }

    std::size_t size() const
    {
      return mValues.size();
    }

    unsigned int operator[](std::size_t slot) const
    {
      return mValues[slot];
    }

    unsigned long getSum() const
    {
      return mSum;
    }

    // e.g. "[0, 2, 1, 0, 0]"
    std::string toString() const;

  private:
    std::vector<unsigned int> mValues;
    unsigned long mSum;
  };

  bool operator<(const WaveOption& lhs, const WaveOption& rhs);
  bool operator==(const WaveOption& lhs, const WaveOption& rhs);
  bool operator!=(const WaveOption& lhs, const WaveOption& rhs);
  std::ostream& operator<<(std::ostream& os, const WaveOption& option);

  /**
   * @class WaveOptionsGenerator
   * @brief Enumerates every skip tuple of a given width within an inclusive
   * [from, to] range, sorted cheapest first.
   *
   * The generator can be re-bounded with setRange() and regenerated with
   * populate() so a search loop can keep the same instance across runs.
   */
  class WaveOptionsGenerator
  {
  public:
    // Upper bound on the number of tuples a single generator may hold
    static constexpr std::uint64_t MAX_OPTIONS = 20000000;

    WaveOptionsGenerator(std::size_t numSlots, unsigned int from, unsigned int to);

    /**
     * @brief Changes the bounds. Call populate() afterwards to regenerate.
     * @throws InvalidConfigurationException if to < from.
     */
    void setRange(unsigned int from, unsigned int to);

    /**
     * @brief Regenerates the sorted option list for the current bounds.
     * @throws InvalidConfigurationException if the range would produce more
     *         than MAX_OPTIONS tuples.
     */
    void populate();

    const std::vector<WaveOption>& getOptionsSorted() const
    {
      return mOptions;
    }

    // (to - from + 1) ^ numSlots
    std::uint64_t getNumberOfOptions() const;

    std::size_t getNumSlots() const { return mNumSlots; }
    unsigned int getFrom() const { return mFrom; }
    unsigned int getTo() const { return mTo; }

  private:
    std::size_t mNumSlots;
    unsigned int mFrom;
    unsigned int mTo;
    std::vector<WaveOption> mOptions;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_WAVE_OPTIONS_H
