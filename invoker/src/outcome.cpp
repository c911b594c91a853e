#include <dispatch/invoker/outcome.hpp>

#include <dispatch/common/exceptions.hpp>
#include <dispatch/common/util.hpp>

namespace dispatch::invoker {

  std::string_view status_to_string(Status status)
  {
    switch (status) {
    case Status::SUCCEEDED:
      return "succeeded";
    case Status::FAULTED:
      return "faulted";
    case Status::CANCELLED:
      return "cancelled";
    case Status::FAILED:
      return "failed";
    }
    return "";
  }

  Status status_of(const Outcome& outcome)
  {
    return std::visit(
        common::util::overloaded{
            [](const Succeeded&) { return Status::SUCCEEDED; },
            [](const Faulted&) { return Status::FAULTED; },
            [](const Cancelled&) { return Status::CANCELLED; },
            [](const Failed&) { return Status::FAILED; }},
        outcome
    );
  }

  void Faulted::rethrow() const
  {
    std::rethrow_exception(fault);
  }

  std::string Failed::message() const
  {
    return common::util::describe(error);
  }

  void Failed::rethrow() const
  {
    std::rethrow_exception(error);
  }

  std::optional<Value> InvocationOutcome::value() const
  {
    if (const auto* success = std::get_if<Succeeded>(&result)) {
      return success->value;
    }
    return std::nullopt;
  }

} // namespace dispatch::invoker
