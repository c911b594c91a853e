#include <dispatch/invoker/operation.hpp>

#include <dispatch/common/exceptions.hpp>

#include <fmt/format.h>

namespace dispatch::invoker {

  std::string_view return_kind_to_string(ReturnKind kind)
  {
    switch (kind) {
    case ReturnKind::NONE:
      return "none";
    case ReturnKind::VALUE:
      return "value";
    case ReturnKind::ASYNC_NONE:
      return "async-none";
    case ReturnKind::ASYNC_VALUE:
      return "async-value";
    }
    return "";
  }

  BoundOperation::BoundOperation(std::string name, Signature signature, compiler_t compiler)
      : _name(std::move(name)), _signature(std::move(signature)), _compiler(std::move(compiler))
  {
    if (_name.empty()) {
      throw common::InvalidArgument{"Bound operation requires a name!"};
    }
    if (!_compiler) {
      throw common::InvalidArgument{fmt::format("Operation {} has no thunk compiler!", _name)};
    }
  }

  bool BoundOperation::returns_value() const
  {
    return return_kind() == ReturnKind::VALUE || return_kind() == ReturnKind::ASYNC_VALUE;
  }

  bool BoundOperation::is_async() const
  {
    return return_kind() == ReturnKind::ASYNC_NONE || return_kind() == ReturnKind::ASYNC_VALUE;
  }

} // namespace dispatch::invoker
