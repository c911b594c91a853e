#include "opts.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

namespace dispatch::cli {

  Options opts(int argc, char** argv)
  {
    cxxopts::Options options("dispatch-invoker", "Invoke a service operation and classify its outcome.");
    options.add_options()
      ("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))
      ("operation", "Name of the operation.", cxxopts::value<std::string>()->default_value(""))
      ("args", "Comma-separated integer inputs.", cxxopts::value<std::vector<int>>())
      ("correlation", "Correlation token of the invocation.", cxxopts::value<std::string>()->default_value("dispatch-cli"))
      ("legacy", "Use the begin/end completion protocol.", cxxopts::value<bool>()->default_value("false"))
      ("list", "List available operations.", cxxopts::value<bool>()->default_value("false"))
      ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"));
    auto parsed_options = options.parse(argc, argv);

    Options result;
    result.config = parsed_options["config"].as<std::string>();
    result.operation = parsed_options["operation"].as<std::string>();
    if (parsed_options.count("args")) {
      result.args = parsed_options["args"].as<std::vector<int>>();
    }
    result.correlation = parsed_options["correlation"].as<std::string>();
    result.legacy = parsed_options["legacy"].as<bool>();
    result.list = parsed_options["list"].as<bool>();
    result.verbose = parsed_options["verbose"].as<bool>();

    if (!result.list && result.operation.empty()) {
      spdlog::error("No operation selected!");
      exit(1);
    }

    return result;
  }

} // namespace dispatch::cli
