#ifndef DISPATCH_COMMON_UTIL_HPP
#define DISPATCH_COMMON_UTIL_HPP

#include <dispatch/common/exceptions.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dispatch::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  // Message of the stored exception, followed by its nested causes
  // separated with ": ".
  std::string describe(const std::exception_ptr& ptr);

  template <typename... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <typename... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

} // namespace dispatch::common::util

#endif
