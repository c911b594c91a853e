#include <dispatch/invoker/config.hpp>

#include <dispatch/common/exceptions.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dispatch::invoker::config {

  namespace {

    // Missing entries keep their defaults.
    template <typename T>
    void load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
    {
      // Cereal does not allow to skip non-existing objects easily.
      // There is also no separate exception type for this.
      try {
        archive(cereal::make_nvp(name, obj));
      } catch (cereal::Exception& exc) {

        if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
            std::string::npos) {
          archive.setNextName(nullptr);
        } else {
          throw common::InvalidConfigurationError(
              "Could not parse invoker configuration, reason: " + std::string{exc.what()}
          );
        }
      }
    }

  } // namespace

  void Invoker::load(cereal::JSONInputArchive& archive)
  {
    set_defaults();

    load_optional(archive, "verbose", verbose);
    load_optional(archive, "instrumentation", instrumentation);
    load_optional(archive, "callback-threads", callback_threads);

    std::string event = cancelled_event_to_string(cancelled_event);
    load_optional(archive, "cancelled-event", event);
    auto parsed = string_to_cancelled_event(event);
    if (!parsed.has_value()) {
      throw common::InvalidConfigurationError{
          fmt::format("Unknown cancelled-event policy {}", event)};
    }
    cancelled_event = parsed.value();

    if (callback_threads < 0) {
      throw common::InvalidConfigurationError{
          fmt::format("Number of callback threads must not be negative, got {}", callback_threads)};
    }
  }

  void Invoker::set_defaults()
  {
    verbose = false;
    instrumentation = DEFAULT_INSTRUMENTATION;
    cancelled_event = CancelledEvent::NONE;
    callback_threads = DEFAULT_CALLBACK_THREADS;
  }

  invoker::Options Invoker::options() const
  {
    invoker::Options opts;
    opts.instrumentation = instrumentation;
    opts.cancelled_event = cancelled_event;
    return opts;
  }

  Invoker Invoker::deserialize(std::istream& json_config)
  {
    Invoker cfg;
    try {
      cereal::JSONInputArchive archive_in(json_config);
      cfg.load(archive_in);
    } catch (common::InvalidConfigurationError&) {
      throw;
    } catch (std::exception& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse invoker configuration, reason: {}", exc.what())};
    }
    return cfg;
  }

  Invoker Invoker::deserialize(const std::string& path)
  {
    if (path.empty()) {
      return Invoker{};
    }

    std::ifstream in_stream{path};
    if (!in_stream.is_open()) {
      throw common::InvalidConfigurationError{fmt::format("Could not open config file {}", path)};
    }
    spdlog::debug("Loading invoker configuration from {}", path);

    return deserialize(in_stream);
  }

} // namespace dispatch::invoker::config
