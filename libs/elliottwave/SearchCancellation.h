// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ELLIOTT_SEARCH_CANCELLATION_H
#define __ELLIOTT_SEARCH_CANCELLATION_H 1

#include <atomic>
#include <chrono>

namespace mkc_elliott
{
  /**
   * @class SearchCancellation
   * @brief Stop flag plus optional deadline polled by a running search.
   *
   * cancel() and isCancelled() may be called from any thread. The deadline
   * is fixed before the search starts.
   */
  class SearchCancellation
  {
  public:
    using Clock = std::chrono::steady_clock;

    SearchCancellation()
      : mCancelled(false),
	mHasDeadline(false),
	mDeadline()
    {}

    explicit SearchCancellation(std::chrono::milliseconds timeout)
      : SearchCancellation()
    {
      setTimeout(timeout);
    }

    SearchCancellation(const SearchCancellation&) = delete;
    SearchCancellation& operator=(const SearchCancellation&) = delete;

    void cancel()
    {
      mCancelled.store(true, std::memory_order_relaxed);
    }

    void setDeadline(Clock::time_point deadline)
    {
      mDeadline = deadline;
      mHasDeadline = true;
    }

    void setTimeout(std::chrono::milliseconds timeout)
    {
      setDeadline(Clock::now() + timeout);
    }

    bool hasDeadline() const
    {
      return mHasDeadline;
    }

    bool isCancelled() const
    {
      if (mCancelled.load(std::memory_order_relaxed))
	return true;

      return mHasDeadline && Clock::now() >= mDeadline;
    }

  private:
    std::atomic<bool> mCancelled;
    bool mHasDeadline;
    Clock::time_point mDeadline;
  };
} // namespace mkc_elliott

#endif // __ELLIOTT_SEARCH_CANCELLATION_H
