#pragma once

#include <algorithm>
#include <cstddef>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Runs body(i) for every i in [0, total), split into contiguous
   * chunks submitted to the executor, and waits for all of them.
   *
   * @param chunkSizeHint Indices per task. Zero splits the range into one
   *        chunk per unit of executor concurrency.
   *
   * Exceptions thrown by body are rethrown once every chunk has finished.
   */
  template<typename Executor, typename Body>
  void parallel_for_chunked(std::size_t total, Executor& exec, Body body, std::size_t chunkSizeHint = 0)
  {
    if (total == 0)
      return;

    std::size_t chunkSize = chunkSizeHint;
    if (chunkSize == 0)
      {
	const std::size_t numTasks = std::max<std::size_t>(1, exec.getConcurrency());
	chunkSize = (total + numTasks - 1) / numTasks;
      }

    std::vector<std::future<void>> futures;
    futures.reserve((total + chunkSize - 1) / chunkSize);

    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([&body, start, end]() {
	  for (std::size_t i = start; i < end; ++i)
	    body(i);
	}));
      }

    exec.waitAll(futures);
  }

  template<typename Executor, typename Body>
  void parallel_for(std::size_t total, Executor& exec, Body body)
  {
    parallel_for_chunked(total, exec, body, 0);
  }
} // namespace concurrency
