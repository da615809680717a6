#pragma once

#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Executor policy interface used by the parallel loops.
   *
   * submit() schedules a task and returns a future that carries the task's
   * exception, if any. waitAll() rethrows the first such exception.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      // Wait for every task before rethrowing so no task outlives the caller's data
      std::exception_ptr first;
      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!first)
		first = std::current_exception();
	    }
	}

      if (first)
	std::rethrow_exception(first);
    }

    // Number of tasks worth splitting a loop into
    virtual std::size_t getConcurrency() const
    {
      return 1;
    }
  };
} // namespace concurrency
