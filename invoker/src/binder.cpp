#include <dispatch/invoker/binder.hpp>

#include <dispatch/common/exceptions.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dispatch::invoker {

  ThunkPtr Binder::compile(const BoundOperation& operation)
  {
    SPDLOG_DEBUG("Compiling invocation thunk for operation {}", operation.name());

    ThunkPtr thunk = operation.compiler()(operation);
    if (!thunk) {
      throw common::InvalidState{
          fmt::format("Compilation of operation {} did not produce a thunk!", operation.name())};
    }

    if (thunk->return_kind() != operation.return_kind()) {
      throw common::InvalidState{fmt::format(
          "Thunk of operation {} returns {}, but the operation declares {}!", operation.name(),
          return_kind_to_string(thunk->return_kind()),
          return_kind_to_string(operation.return_kind())
      )};
    }

    return thunk;
  }

  ThunkPtr Binder::ensure_compiled(const BoundOperation& operation)
  {
    ThunkPtr thunk = operation.thunk();
    if (!thunk) {
      thunk = compile(operation);
      // Publish only the fully constructed thunk.
      operation.publish(thunk);
    }
    return thunk;
  }

} // namespace dispatch::invoker
