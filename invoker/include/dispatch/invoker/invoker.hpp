#ifndef DISPATCH_INVOKER_INVOKER_HPP
#define DISPATCH_INVOKER_INVOKER_HPP

#include <dispatch/invoker/operation.hpp>
#include <dispatch/invoker/outcome.hpp>
#include <dispatch/invoker/pending.hpp>
#include <dispatch/invoker/telemetry.hpp>
#include <dispatch/invoker/value.hpp>

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dispatch::invoker {

  // Telemetry recorded for a cancelled invocation.
  enum class CancelledEvent { NONE = 0, CANCELLED, FAILED };

  std::string cancelled_event_to_string(CancelledEvent val);

  std::optional<CancelledEvent> string_to_cancelled_event(std::string_view val);

  struct Options {

    // Emit telemetry events when a sink is attached and enabled.
    bool instrumentation = true;

    CancelledEvent cancelled_event = CancelledEvent::NONE;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Invokes one bound operation and classifies each invocation into
  /// exactly one terminal outcome.
  ///
  /// Safe to use concurrently; each invocation owns its inputs, outputs and
  /// outcome. The only shared state is the operation's memoized thunk.
  ////////////////////////////////////////////////////////////////////////////////
  class Invoker {
  public:
    Invoker(OperationPtr operation, TelemetryPtr telemetry = nullptr, Options options = {});

    const BoundOperation& operation() const
    {
      return *_operation;
    }

    const std::string& name() const
    {
      return _operation->name();
    }

    const Options& options() const
    {
      return _options;
    }

    // Default-valued inputs sized to the operation's input slot count.
    Values allocate_inputs() const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Invokes the operation on the service instance.
    ///
    /// Precondition failures (null instance, a service object of another type
    /// than the bound one, wrong number of inputs) produce a
    /// settled Failed outcome without compiling or calling the operation.
    /// Operations completing immediately return a settled handle. Asynchronous
    /// operations return a handle settled by whoever completes the operation's
    /// computation; no thread waits in between.
    ///
    /// @param[in] instance service object owning the operation
    /// @param[in] inputs positional input values
    /// @param[in] correlation token attached to telemetry events
    /// @return handle to the invocation outcome
    ////////////////////////////////////////////////////////////////////////////////
    Pending<InvocationOutcome>
    invoke(Instance instance, Values inputs, std::string_view correlation = "") const;

  private:
    struct Call;

    // Sink errors disable instrumentation of the invocation.
    bool _instrumented() const;

    Pending<InvocationOutcome> _reject(std::exception_ptr error) const;

    static void _finish(const std::shared_ptr<Call>& call, const detail::SharedState& settled);

    OperationPtr _operation;

    TelemetryPtr _telemetry;

    Options _options;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace dispatch::invoker

#endif
