#include <dispatch/invoker/invoker.hpp>

#include <dispatch/common/exceptions.hpp>
#include <dispatch/common/util.hpp>
#include <dispatch/invoker/binder.hpp>
#include <dispatch/invoker/classifier.hpp>

#include <chrono>
#include <optional>
#include <typeindex>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dispatch::invoker {

  std::string cancelled_event_to_string(CancelledEvent val)
  {
    switch (val) {
    case CancelledEvent::NONE:
      return "none";
    case CancelledEvent::CANCELLED:
      return "cancelled";
    case CancelledEvent::FAILED:
      return "failed";
    }
    return "";
  }

  std::optional<CancelledEvent> string_to_cancelled_event(std::string_view val)
  {
    if (val == "none") {
      return CancelledEvent::NONE;
    }
    if (val == "cancelled") {
      return CancelledEvent::CANCELLED;
    }
    if (val == "failed") {
      return CancelledEvent::FAILED;
    }
    return std::nullopt;
  }

  // State of a single invocation, kept alive until the outcome is published.
  struct Invoker::Call {

    OperationPtr operation;

    Instance instance;

    Values inputs;

    Values outputs;

    std::string correlation;

    // Null when the invocation is not instrumented.
    TelemetryPtr telemetry;

    CancelledEvent cancelled_event;

    std::shared_ptr<spdlog::logger> logger;

    std::chrono::steady_clock::time_point start;

    Promise<InvocationOutcome> promise;

    duration_t elapsed() const
    {
      return std::chrono::duration_cast<duration_t>(std::chrono::steady_clock::now() - start);
    }

    template <typename F>
    void emit(std::string_view event, F&& func) const
    {
      try {
        func(*telemetry);
      } catch (...) {
        logger->warn(
            "Telemetry event {} of operation {} failed: {}", event, operation->name(),
            common::util::describe(std::current_exception())
        );
      }
    }
  };

  Invoker::Invoker(OperationPtr operation, TelemetryPtr telemetry, Options options)
      : _operation(std::move(operation)), _telemetry(std::move(telemetry)), _options(options)
  {
    if (!_operation) {
      throw common::InvalidArgument{"Invoker requires a bound operation!"};
    }
    _logger = common::util::create_logger("Invoker");
  }

  Values Invoker::allocate_inputs() const
  {
    return Values(_operation->input_count());
  }

  Pending<InvocationOutcome>
  Invoker::invoke(Instance instance, Values inputs, std::string_view correlation) const
  {
    if (!instance) {
      return _reject(std::make_exception_ptr(common::InvalidState{
          fmt::format("No service object was provided for operation {}!", name())}));
    }

    const std::type_index& service = _operation->signature().service;
    if (service != std::type_index{typeid(void)} && instance.type() != service) {
      return _reject(std::make_exception_ptr(common::InvalidState{fmt::format(
          "Operation {} expects a service object of type {}, but {} was provided!", name(),
          service.name(), instance.type().name()
      )}));
    }

    if (inputs.size() != _operation->input_count()) {
      return _reject(std::make_exception_ptr(common::ArgumentMismatch{fmt::format(
          "Operation {} expects {} input parameters, but {} were provided!", name(),
          _operation->input_count(), inputs.size()
      )}));
    }

    auto call = std::make_shared<Call>();
    call->operation = _operation;
    call->instance = std::move(instance);
    call->inputs = std::move(inputs);
    call->outputs.resize(_operation->output_count());
    call->correlation = std::string{correlation};
    call->cancelled_event = _options.cancelled_event;
    call->logger = _logger;
    call->start = std::chrono::steady_clock::now();

    Pending<InvocationOutcome> result = call->promise.pending();

    ThunkPtr thunk;
    try {
      thunk = Binder::ensure_compiled(*_operation);
    } catch (...) {
      // The invocation never started - no telemetry.
      _finish(call, *detail::SharedState::make_error(std::current_exception()));
      return result;
    }

    if (_instrumented()) {
      call->telemetry = _telemetry;
      call->emit("invoked", [&call](TelemetrySink& sink) {
        sink.invoked(call->operation->name(), call->correlation);
      });
    }

    SPDLOG_LOGGER_DEBUG(
        _logger, "Invoking operation {}, correlation {}", name(), call->correlation
    );

    detail::StatePtr settled;
    try {
      RawResult raw = (*thunk)(call->instance.get(), call->inputs, call->outputs);
      settled = std::visit(
          common::util::overloaded{
              [](std::monostate&) { return detail::SharedState::make_value(Value{}); },
              [](Value& value) { return detail::SharedState::make_value(std::move(value)); },
              [](detail::StatePtr& state) { return std::move(state); }},
          raw
      );
    } catch (...) {
      settled = detail::SharedState::make_error(std::current_exception());
    }

    // Runs right away if the computation is already settled, otherwise on
    // the thread that settles it.
    const detail::SharedState* state = settled.get();
    settled->on_settled([call, state]() { _finish(call, *state); });

    return result;
  }

  bool Invoker::_instrumented() const
  {
    if (!_options.instrumentation || !_telemetry) {
      return false;
    }

    try {
      return _telemetry->enabled();
    } catch (...) {
      _logger->warn(
          "Telemetry sink of operation {} failed, invocation is not instrumented: {}", name(),
          common::util::describe(std::current_exception())
      );
      return false;
    }
  }

  Pending<InvocationOutcome> Invoker::_reject(std::exception_ptr error) const
  {
    SPDLOG_LOGGER_DEBUG(
        _logger, "Rejecting invocation of {}: {}", name(), common::util::describe(error)
    );

    InvocationOutcome outcome;
    outcome.result = Failed{std::move(error)};
    outcome.outputs.resize(_operation->output_count());
    return make_ready(std::move(outcome));
  }

  void Invoker::_finish(const std::shared_ptr<Call>& call, const detail::SharedState& settled)
  {
    const auto& operation = *call->operation;

    InvocationOutcome outcome;
    outcome.result = FailureClassifier::classify(operation.name(), settled);

    // The value is read only once success is established.
    auto* success = std::get_if<Succeeded>(&outcome.result);
    if (success && operation.returns_value()) {
      success->value = settled.value();
    }

    outcome.outputs = std::move(call->outputs);
    outcome.duration = call->elapsed();

    if (call->telemetry) {

      const std::string& name = operation.name();
      const std::string& correlation = call->correlation;
      duration_t duration = outcome.duration;

      switch (outcome.status()) {
      case Status::SUCCEEDED:
        call->emit("completed", [&](TelemetrySink& sink) {
          sink.completed(name, correlation, duration);
        });
        break;
      case Status::FAULTED:
        call->emit("faulted", [&](TelemetrySink& sink) {
          sink.faulted(name, correlation, duration);
        });
        break;
      case Status::FAILED:
        call->emit("failed", [&](TelemetrySink& sink) {
          sink.failed(name, correlation, duration);
        });
        break;
      case Status::CANCELLED:
        if (call->cancelled_event == CancelledEvent::CANCELLED) {
          call->emit("cancelled", [&](TelemetrySink& sink) {
            sink.cancelled(name, correlation, duration);
          });
        } else if (call->cancelled_event == CancelledEvent::FAILED) {
          call->emit("failed", [&](TelemetrySink& sink) {
            sink.failed(name, correlation, duration);
          });
        }
        break;
      }
    }

    SPDLOG_LOGGER_DEBUG(
        call->logger, "Operation {} finished with status {} in {} us, correlation {}",
        operation.name(), status_to_string(outcome.status()), outcome.duration.count(),
        call->correlation
    );

    call->promise.set_value(std::move(outcome));
  }

} // namespace dispatch::invoker
