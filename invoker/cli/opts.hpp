#ifndef DISPATCH_INVOKER_CLI_OPTS_HPP
#define DISPATCH_INVOKER_CLI_OPTS_HPP

#include <string>
#include <vector>

namespace dispatch::cli {

  struct Options {

    std::string config;

    std::string operation;
    std::vector<int> args;
    std::string correlation;

    bool legacy;
    bool list;
    bool verbose;
  };

  Options opts(int argc, char** argv);

} // namespace dispatch::cli

#endif
