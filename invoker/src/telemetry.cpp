#include <dispatch/invoker/telemetry.hpp>

#include <dispatch/common/util.hpp>

namespace dispatch::invoker {

  LoggingTelemetry::LoggingTelemetry() : _logger(common::util::create_logger("Telemetry")) {}

  LoggingTelemetry::LoggingTelemetry(std::shared_ptr<spdlog::logger> logger)
      : _logger(std::move(logger))
  {
  }

  bool LoggingTelemetry::enabled() const
  {
    return _logger != nullptr && _logger->should_log(spdlog::level::info);
  }

  void LoggingTelemetry::invoked(std::string_view operation, std::string_view correlation)
  {
    _logger->info("Operation {} invoked, correlation {}", operation, correlation);
  }

  void LoggingTelemetry::completed(
      std::string_view operation, std::string_view correlation, duration_t duration
  )
  {
    _logger->info(
        "Operation {} completed in {} us, correlation {}", operation, duration.count(),
        correlation
    );
  }

  void LoggingTelemetry::faulted(
      std::string_view operation, std::string_view correlation, duration_t duration
  )
  {
    _logger->warn(
        "Operation {} faulted after {} us, correlation {}", operation, duration.count(),
        correlation
    );
  }

  void LoggingTelemetry::failed(
      std::string_view operation, std::string_view correlation, duration_t duration
  )
  {
    _logger->error(
        "Operation {} failed after {} us, correlation {}", operation, duration.count(),
        correlation
    );
  }

  void LoggingTelemetry::cancelled(
      std::string_view operation, std::string_view correlation, duration_t duration
  )
  {
    _logger->info(
        "Operation {} cancelled after {} us, correlation {}", operation, duration.count(),
        correlation
    );
  }

} // namespace dispatch::invoker
