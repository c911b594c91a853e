#ifndef DISPATCH_INVOKER_TELEMETRY_HPP
#define DISPATCH_INVOKER_TELEMETRY_HPP

#include <chrono>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dispatch::invoker {

  using duration_t = std::chrono::microseconds;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Collector of invocation events.
  ///
  /// Events are purely observational. Exceptions thrown by a sink are logged by
  /// the invoker and never change the invocation's outcome.
  ////////////////////////////////////////////////////////////////////////////////
  struct TelemetrySink {

    virtual ~TelemetrySink() = default;

    virtual bool enabled() const
    {
      return true;
    }

    virtual void invoked(std::string_view operation, std::string_view correlation) = 0;

    virtual void
    completed(std::string_view operation, std::string_view correlation, duration_t duration) = 0;

    virtual void
    faulted(std::string_view operation, std::string_view correlation, duration_t duration) = 0;

    virtual void
    failed(std::string_view operation, std::string_view correlation, duration_t duration) = 0;

    virtual void
    cancelled(std::string_view operation, std::string_view correlation, duration_t duration) = 0;
  };

  using TelemetryPtr = std::shared_ptr<TelemetrySink>;

  // Writes events to a spdlog logger.
  struct LoggingTelemetry : TelemetrySink {

    LoggingTelemetry();

    explicit LoggingTelemetry(std::shared_ptr<spdlog::logger> logger);

    bool enabled() const override;

    void invoked(std::string_view operation, std::string_view correlation) override;

    void
    completed(std::string_view operation, std::string_view correlation, duration_t duration)
        override;

    void faulted(std::string_view operation, std::string_view correlation, duration_t duration)
        override;

    void
    failed(std::string_view operation, std::string_view correlation, duration_t duration) override;

    void
    cancelled(std::string_view operation, std::string_view correlation, duration_t duration)
        override;

  private:
    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace dispatch::invoker

#endif
