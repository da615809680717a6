// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_ZIGZAG_H
#define __ELLIOTT_ZIGZAG_H 1

#include <cstddef>
#include <vector>
#include "PriceSeries.h"

namespace mkc_elliott
{
  struct ZigZagPivot
  {
    std::size_t index;
    double price;
    bool isHigh;
  };

  inline bool operator==(const ZigZagPivot& lhs, const ZigZagPivot& rhs)
  {
    return lhs.index == rhs.index && lhs.price == rhs.price && lhs.isHigh == rhs.isHigh;
  }

  inline bool operator!=(const ZigZagPivot& lhs, const ZigZagPivot& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @brief Compresses the series into alternating low/high pivots.
   *
   * The scan starts in the up state with the first bar's low as the pending
   * pivot. In the up state a low at or below the pending low replaces it; a
   * high at least threshold above the pending low commits a high pivot and
   * flips to the down state. The down state is the mirror image. Consecutive
   * pivots therefore always alternate and every committed leg moves at least
   * threshold (as a fraction, e.g. 0.05 for 5%).
   *
   * @param series The OHLC series to scan.
   * @param threshold Minimum reversal as a fraction, must be in (0, 1).
   * @return The pivots in index order; empty for an empty series.
   * @throws InvalidConfigurationException if threshold is outside (0, 1).
   */
  std::vector<ZigZagPivot> detectZigZag(const PriceSeries& series, double threshold);
} // namespace mkc_elliott

#endif // __ELLIOTT_ZIGZAG_H
