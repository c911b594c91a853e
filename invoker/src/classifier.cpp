#include <dispatch/invoker/classifier.hpp>

#include <dispatch/common/exceptions.hpp>
#include <dispatch/common/util.hpp>

#include <fmt/format.h>

namespace dispatch::invoker {

  Outcome FailureClassifier::classify(std::string_view operation, const detail::SharedState& settled)
  {
    switch (settled.settlement()) {
    case Settlement::PENDING:
      throw common::InvalidState{
          fmt::format("Cannot classify operation {} before it settles!", operation)};
    case Settlement::CANCELLED:
      return Cancelled{};
    case Settlement::VALUE:
      return Succeeded{};
    case Settlement::ERROR:
      break;
    }

    const std::exception_ptr& error = settled.error();
    try {
      std::rethrow_exception(error);
    } catch (const common::BusinessFault& fault) {
      return Faulted{error, fault.code(), fault.reason()};
    } catch (const common::OperationCancelled&) {
      return Cancelled{};
    } catch (...) {
      return Failed{wrap(operation, error)};
    }
  }

  std::exception_ptr
  FailureClassifier::wrap(std::string_view operation, const std::exception_ptr& cause)
  {
    common::InvocationFailure failure{
        std::string{operation},
        fmt::format("Invocation of operation {} failed", operation)};

    try {
      std::rethrow_exception(cause);
    } catch (...) {
      // Nests the active exception - the original cause.
      try {
        std::throw_with_nested(std::move(failure));
      } catch (...) {
        return std::current_exception();
      }
    }
  }

} // namespace dispatch::invoker
