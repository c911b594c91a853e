#ifndef DISPATCH_INVOKER_EXECUTOR_HPP
#define DISPATCH_INVOKER_EXECUTOR_HPP

#include <functional>
#include <memory>

#include <tbb/task_arena.h>
#include <tbb/task_group.h>

namespace dispatch::invoker {

  struct Executor {

    using task_t = std::function<void()>;

    virtual ~Executor() = default;

    virtual void schedule(task_t&& task) = 0;
  };

  using ExecutorPtr = std::shared_ptr<Executor>;

  // Runs tasks on the scheduling thread.
  struct InlineExecutor : Executor {

    void schedule(task_t&& task) override;
  };

  // Runs tasks on a dedicated TBB arena. Waits for pending tasks on destruction.
  class ThreadPoolExecutor : public Executor {
  public:
    explicit ThreadPoolExecutor(int threads);

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    ~ThreadPoolExecutor() noexcept override;

    void schedule(task_t&& task) override;

    void wait();

  private:
    tbb::task_arena _arena;
    tbb::task_group _group;
  };

  // Inline executor for zero threads, a thread pool otherwise.
  ExecutorPtr make_executor(int threads);

} // namespace dispatch::invoker

#endif
