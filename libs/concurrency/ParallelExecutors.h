#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>
#include "IParallelExecutor.h"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the parallel loops in ParallelFor.h.
 *
 *  - SingleThreadExecutor: runs each task inline on the calling thread.
 *  - ThreadPoolExecutor<N>: fixed pool of worker threads fed from one queue.
 *
 * Searches that must be reproducible do not depend on the policy: callers
 * write results into slots owned by the task index and merge them serially.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try
	{
	  task();
	  prom.set_value();
	}
      catch (...)
	{
	  prom.set_exception(std::current_exception());
	}
      return fut;
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * The pool size is N when N > 0. With N == 0 the default constructor uses
   * std::thread::hardware_concurrency() (2 if unknown), and the size can also
   * be chosen at run time through the explicit constructor.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    ThreadPoolExecutor()
      : ThreadPoolExecutor(N)
    {}

    explicit ThreadPoolExecutor(std::size_t numThreads)
      : mStop(false)
    {
      const std::size_t threads = (numThreads > 0) ? numThreads : defaultThreadCount();

      try
	{
	  for (std::size_t i = 0; i < threads; ++i)
	    mWorkers.emplace_back([this] { workerLoop(); });
	}
      catch (...)
	{
	  shutdown();
	  throw;
	}
    }

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::lock_guard<std::mutex> lock(mTasksMutex);
	if (mStop)
	  throw std::runtime_error("ThreadPoolExecutor: submit on a stopped pool");
	mTasks.emplace([packaged]() { (*packaged)(); });
      }
      mCondition.notify_one();
      return fut;
    }

    std::size_t getConcurrency() const override
    {
      return mWorkers.size();
    }

  private:
    static std::size_t defaultThreadCount()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    void workerLoop()
    {
      for (;;)
	{
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(mTasksMutex);
	    mCondition.wait(lock, [this] { return mStop || !mTasks.empty(); });
	    if (mStop && mTasks.empty())
	      return;
	    task = std::move(mTasks.front());
	    mTasks.pop();
	  }
	  task();
	}
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(mTasksMutex);
	mStop = true;
      }
      mCondition.notify_all();
      for (auto& worker : mWorkers)
	{
	  if (worker.joinable())
	    worker.join();
	}
    }

    std::vector<std::thread> mWorkers;
    std::queue<std::function<void()>> mTasks;
    std::mutex mTasksMutex;
    std::condition_variable mCondition;
    bool mStop;
  };
} // namespace concurrency
