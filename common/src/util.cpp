#include <dispatch/common/util.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dispatch::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  namespace {

    constexpr std::string_view UNKNOWN_EXCEPTION = "unknown exception";

    void append(std::string& out, std::string_view msg)
    {
      if (!out.empty()) {
        out += ": ";
      }
      out += msg;
    }

    void describe_nested(const std::exception& exc, std::string& out)
    {
      append(out, exc.what());

      try {
        std::rethrow_if_nested(exc);
      } catch (const std::exception& nested) {
        describe_nested(nested, out);
      } catch (...) {
        append(out, UNKNOWN_EXCEPTION);
      }
    }

  } // namespace

  std::string describe(const std::exception_ptr& ptr)
  {
    if (!ptr) {
      return "";
    }

    std::string out;
    try {
      std::rethrow_exception(ptr);
    } catch (const std::exception& exc) {
      describe_nested(exc, out);
    } catch (...) {
      append(out, UNKNOWN_EXCEPTION);
    }
    return out;
  }

} // namespace dispatch::common::util
