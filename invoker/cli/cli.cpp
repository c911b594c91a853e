#include <dispatch/common/exceptions.hpp>
#include <dispatch/common/util.hpp>
#include <dispatch/invoker/completion.hpp>
#include <dispatch/invoker/config.hpp>
#include <dispatch/invoker/executor.hpp>
#include <dispatch/invoker/invoker.hpp>
#include <dispatch/invoker/table.hpp>
#include <dispatch/invoker/telemetry.hpp>

#include <memory>
#include <string>
#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "opts.hpp"
#include "order_service.hpp"

using namespace dispatch;

std::string format_value(const invoker::Value& value)
{
  if (!value.has_value()) {
    return "<none>";
  }
  if (value.type() == typeid(int)) {
    return std::to_string(std::any_cast<int>(value));
  }
  return fmt::format("<{}>", value.type().name());
}

void print_outputs(const invoker::Values& outputs)
{
  for (size_t i = 0; i < outputs.size(); ++i) {
    spdlog::info("Output {}: {}", i, format_value(outputs[i]));
  }
}

int run_direct(
    const invoker::Invoker& op_invoker, const invoker::Instance& service, invoker::Values inputs,
    const std::string& correlation
)
{
  auto outcome = op_invoker.invoke(service, std::move(inputs), correlation).get();

  std::visit(
      common::util::overloaded{
          [](const invoker::Succeeded& success) {
            spdlog::info(
                "Succeeded, result {}",
                success.value.has_value() ? format_value(success.value.value()) : "<void>"
            );
          },
          [](const invoker::Faulted& fault) {
            spdlog::warn("Faulted with {}: {}", fault.code, fault.reason);
          },
          [](const invoker::Cancelled&) { spdlog::warn("Cancelled"); },
          [](const invoker::Failed& failure) { spdlog::error("Failed: {}", failure.message()); }},
      outcome.result
  );
  print_outputs(outcome.outputs);
  spdlog::info("Invocation took {} us", outcome.duration.count());

  return outcome.succeeded() ? 0 : 1;
}

int run_legacy(
    const invoker::Invoker& op_invoker, int callback_threads, const invoker::Instance& service,
    invoker::Values inputs, const std::string& correlation
)
{
  invoker::CompletionBridge bridge{op_invoker, invoker::make_executor(callback_threads)};

  auto token = bridge.begin_invoke(
      service, std::move(inputs), correlation,
      [](const invoker::AsyncResultPtr& result) {
        spdlog::info(
            "Invocation completed, synchronously: {}", result->completed_synchronously()
        );
      }
  );

  try {
    auto [value, outputs] = bridge.end_invoke(token);
    spdlog::info("Succeeded, result {}", value.has_value() ? format_value(value.value()) : "<void>");
    print_outputs(outputs);
    return 0;
  } catch (const common::BusinessFault& fault) {
    spdlog::warn("Faulted with {}: {}", fault.code(), fault.reason());
  } catch (const common::OperationCancelled& exc) {
    spdlog::warn("Cancelled: {}", exc.what());
  } catch (const common::DispatchException&) {
    spdlog::error("Failed: {}", common::util::describe(std::current_exception()));
  }
  return 1;
}

int main(int argc, char** argv)
{
  auto options = cli::opts(argc, argv);

  invoker::config::Invoker config;
  try {
    config = invoker::config::Invoker::deserialize(options.config);
  } catch (const common::InvalidConfigurationError& exc) {
    spdlog::error("Incorrect configuration: {}", exc.what());
    return 1;
  }

  if (options.verbose || config.verbose)
    spdlog::set_level(spdlog::level::debug);
  else
    spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing dispatch invoker!");

  invoker::OperationTable table;
  cli::register_operations(table);

  if (options.list) {
    for (const auto& name : table.names()) {
      auto operation = table.at(name);
      spdlog::info(
          "Operation {}: {} inputs, {} outputs, returns {}", name, operation->input_count(),
          operation->output_count(), invoker::return_kind_to_string(operation->return_kind())
      );
    }
    return 0;
  }

  auto operation = table.get(options.operation);
  if (!operation) {
    spdlog::error("Unknown operation {}", options.operation);
    return 1;
  }

  invoker::Invoker op_invoker{
      operation, std::make_shared<invoker::LoggingTelemetry>(), config.options()};

  invoker::Values inputs;
  for (int arg : options.args) {
    inputs.emplace_back(arg);
  }

  auto service = std::make_shared<cli::OrderService>();

  int ret = 0;
  if (options.legacy) {
    ret = run_legacy(
        op_invoker, config.callback_threads, service, std::move(inputs), options.correlation
    );
  } else {
    ret = run_direct(op_invoker, service, std::move(inputs), options.correlation);
  }

  spdlog::info("Dispatch invoker is closing down");
  return ret;
}
