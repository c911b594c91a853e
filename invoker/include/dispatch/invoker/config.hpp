#ifndef DISPATCH_INVOKER_CONFIG_HPP
#define DISPATCH_INVOKER_CONFIG_HPP

#include <dispatch/invoker/invoker.hpp>

#include <istream>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace dispatch::invoker::config {

  struct Invoker {

    static constexpr bool DEFAULT_INSTRUMENTATION = true;
    static constexpr int DEFAULT_CALLBACK_THREADS = 0;

    bool verbose;
    bool instrumentation;
    CancelledEvent cancelled_event;

    // Zero runs completion callbacks inline.
    int callback_threads;

    Invoker()
    {
      set_defaults();
    }

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    invoker::Options options() const;

    static Invoker deserialize(std::istream&);

    // Defaults when the path is empty.
    static Invoker deserialize(const std::string& path);
  };

} // namespace dispatch::invoker::config

#endif
