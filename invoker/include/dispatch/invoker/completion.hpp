#ifndef DISPATCH_INVOKER_COMPLETION_HPP
#define DISPATCH_INVOKER_COMPLETION_HPP

#include <dispatch/invoker/executor.hpp>
#include <dispatch/invoker/invoker.hpp>
#include <dispatch/invoker/outcome.hpp>
#include <dispatch/invoker/pending.hpp>

#include <any>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <tuple>

namespace dispatch::invoker {

  class CompletionBridge;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Token of an invocation started with CompletionBridge::begin_invoke.
  ////////////////////////////////////////////////////////////////////////////////
  class AsyncResult {
  public:
    using callback_t = std::function<void(const std::shared_ptr<AsyncResult>&)>;

    // Caller-supplied state passed to begin_invoke.
    const std::any& state() const
    {
      return _state;
    }

    bool is_completed() const
    {
      return _outcome.is_settled();
    }

    // True when the outcome was available before begin_invoke returned.
    bool completed_synchronously() const
    {
      return _completed_synchronously;
    }

    void wait() const
    {
      _outcome.wait();
    }

  private:
    friend class CompletionBridge;

    AsyncResult(const BoundOperation* operation, std::any state)
        : _operation(operation), _state(std::move(state))
    {
    }

    const BoundOperation* _operation;

    std::any _state;

    Pending<InvocationOutcome> _outcome;

    bool _completed_synchronously{};

    std::atomic<bool> _ended{};
  };

  using AsyncResultPtr = std::shared_ptr<AsyncResult>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Begin/end completion protocol over an Invoker, for callers that
  /// consume results through a callback instead of a pending handle.
  ///
  /// end_invoke blocks the calling thread until the invocation completes.
  ////////////////////////////////////////////////////////////////////////////////
  class CompletionBridge {
  public:
    using result_t = std::tuple<std::optional<Value>, Values>;

    explicit CompletionBridge(Invoker invoker, ExecutorPtr executor = nullptr);

    const Invoker& invoker() const
    {
      return _invoker;
    }

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Starts an invocation.
    ///
    /// The callback is scheduled on the bridge's executor exactly once, as soon as
    /// the outcome is available, also when the invocation completed immediately.
    ///
    /// @param[in] instance service object
    /// @param[in] inputs positional input values
    /// @param[in] correlation token attached to telemetry events
    /// @param[in] on_complete optional completion callback
    /// @param[in] state caller state returned by AsyncResult::state
    /// @return token to pass to end_invoke
    ////////////////////////////////////////////////////////////////////////////////
    AsyncResultPtr begin_invoke(
        Instance instance, Values inputs, std::string_view correlation,
        AsyncResult::callback_t on_complete, std::any state = {}
    );

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Finishes an invocation, waiting for it if necessary.
    ///
    /// A business fault is rethrown unchanged, cancellation raises
    /// OperationCancelled, failures rethrow the classified error.
    ///
    /// @param[in] token result of begin_invoke on this bridge, used once
    /// @return return value, if declared, and output values
    ////////////////////////////////////////////////////////////////////////////////
    result_t end_invoke(const AsyncResultPtr& token);

  private:
    Invoker _invoker;

    ExecutorPtr _executor;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace dispatch::invoker

#endif
