#ifndef DISPATCH_COMMON_EXCEPTIONS_HPP
#define DISPATCH_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace dispatch::common {

  struct DispatchException : std::runtime_error {

    DispatchException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : DispatchException {

    InvalidConfigurationError(const std::string& msg) : DispatchException(msg) {}
  };

  struct InvalidArgument : DispatchException {

    InvalidArgument(const std::string& msg) : DispatchException(msg) {}
  };

  // Number of supplied inputs does not match the operation's declared slots.
  struct ArgumentMismatch : DispatchException {

    ArgumentMismatch(const std::string& msg) : DispatchException(msg) {}
  };

  struct InvalidState : DispatchException {

    InvalidState(const std::string& msg) : DispatchException(msg) {}
  };

  struct ObjectExists : DispatchException {

    ObjectExists(const std::string& name) : DispatchException(name) {}
  };

  struct ObjectDoesNotExist : DispatchException {

    ObjectDoesNotExist(const std::string& name) : DispatchException(name) {}
  };

  struct OperationCancelled : DispatchException {

    OperationCancelled() : DispatchException("The operation was cancelled.") {}

    OperationCancelled(const std::string& msg) : DispatchException(msg) {}
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Structured error raised by a service operation and returned to the
  /// remote caller as-is. Derive from it to define domain faults.
  ///
  /// The invoker never wraps or copies a business fault; the exception object
  /// thrown by the operation is the one the caller observes.
  ////////////////////////////////////////////////////////////////////////////////
  struct BusinessFault : DispatchException {

    BusinessFault(std::string code, const std::string& reason)
        : DispatchException(reason), _code(std::move(code))
    {
    }

    const std::string& code() const
    {
      return _code;
    }

    std::string reason() const
    {
      return what();
    }

  private:
    std::string _code;
  };

  // Infrastructure failure of an invocation. Always thrown through
  // std::throw_with_nested, the original cause is available with
  // std::rethrow_if_nested.
  struct InvocationFailure : DispatchException {

    InvocationFailure(std::string operation, const std::string& msg)
        : DispatchException(msg), _operation(std::move(operation))
    {
    }

    const std::string& operation() const
    {
      return _operation;
    }

  private:
    std::string _operation;
  };

} // namespace dispatch::common

#endif
