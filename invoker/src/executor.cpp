#include <dispatch/invoker/executor.hpp>

#include <dispatch/common/exceptions.hpp>

#include <fmt/format.h>

namespace dispatch::invoker {

  namespace {

    int require_positive(int threads)
    {
      if (threads <= 0) {
        throw common::InvalidArgument{
            fmt::format("Thread pool requires a positive number of threads, got {}", threads)};
      }
      return threads;
    }

  } // namespace

  void InlineExecutor::schedule(task_t&& task)
  {
    task();
  }

  ThreadPoolExecutor::ThreadPoolExecutor(int threads) : _arena(require_positive(threads))
  {
    _arena.initialize();
  }

  ThreadPoolExecutor::~ThreadPoolExecutor() noexcept
  {
    wait();
  }

  void ThreadPoolExecutor::schedule(task_t&& task)
  {
    _arena.execute([this, &task]() { _group.run(std::move(task)); });
  }

  void ThreadPoolExecutor::wait()
  {
    _arena.execute([this]() { _group.wait(); });
  }

  ExecutorPtr make_executor(int threads)
  {
    if (threads == 0) {
      return std::make_shared<InlineExecutor>();
    }
    return std::make_shared<ThreadPoolExecutor>(threads);
  }

} // namespace dispatch::invoker
