#ifndef DISPATCH_INVOKER_OUTCOME_HPP
#define DISPATCH_INVOKER_OUTCOME_HPP

#include <dispatch/invoker/value.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dispatch::invoker {

  enum class Status { SUCCEEDED = 0, FAULTED, CANCELLED, FAILED };

  std::string_view status_to_string(Status status);

  struct Succeeded {

    // Present only when the operation declares a return value.
    std::optional<Value> value{};
  };

  struct Faulted {

    // The business fault thrown by the operation, never wrapped.
    std::exception_ptr fault;

    std::string code;

    std::string reason;

    [[noreturn]] void rethrow() const;
  };

  struct Cancelled {};

  struct Failed {

    // ArgumentMismatch and InvalidState before dispatch, otherwise an
    // InvocationFailure nesting the original cause.
    std::exception_ptr error;

    std::string message() const;

    [[noreturn]] void rethrow() const;
  };

  using Outcome = std::variant<Succeeded, Faulted, Cancelled, Failed>;

  Status status_of(const Outcome& outcome);

  struct InvocationOutcome {

    Outcome result;

    // Always sized to the operation's output slot count.
    Values outputs;

    std::chrono::microseconds duration{0};

    Status status() const
    {
      return status_of(result);
    }

    bool succeeded() const
    {
      return status() == Status::SUCCEEDED;
    }

    std::optional<Value> value() const;
  };

} // namespace dispatch::invoker

#endif
