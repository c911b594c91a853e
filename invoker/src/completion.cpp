#include <dispatch/invoker/completion.hpp>

#include <dispatch/common/exceptions.hpp>
#include <dispatch/common/util.hpp>

#include <variant>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dispatch::invoker {

  CompletionBridge::CompletionBridge(Invoker invoker, ExecutorPtr executor)
      : _invoker(std::move(invoker)), _executor(std::move(executor))
  {
    if (!_executor) {
      _executor = std::make_shared<InlineExecutor>();
    }
    _logger = common::util::create_logger("CompletionBridge");
  }

  AsyncResultPtr CompletionBridge::begin_invoke(
      Instance instance, Values inputs, std::string_view correlation,
      AsyncResult::callback_t on_complete, std::any state
  )
  {
    AsyncResultPtr result{new AsyncResult{&_invoker.operation(), std::move(state)}};

    result->_outcome = _invoker.invoke(std::move(instance), std::move(inputs), correlation);
    result->_completed_synchronously = result->_outcome.is_settled();

    if (on_complete) {
      // Registered exactly once; fires immediately when already settled.
      result->_outcome.then([executor = _executor, logger = _logger, result,
                             on_complete = std::move(on_complete)]() mutable {
        executor->schedule([logger, result, on_complete = std::move(on_complete)]() {
          try {
            on_complete(result);
          } catch (...) {
            logger->error(
                "Completion callback of operation {} failed: {}", result->_operation->name(),
                common::util::describe(std::current_exception())
            );
          }
        });
      });
    }

    return result;
  }

  CompletionBridge::result_t CompletionBridge::end_invoke(const AsyncResultPtr& token)
  {
    if (!token) {
      throw common::InvalidArgument{"Invalid completion token!"};
    }

    if (token->_operation != &_invoker.operation()) {
      throw common::InvalidArgument{fmt::format(
          "Completion token was not issued for operation {}!", _invoker.name()
      )};
    }

    if (token->_ended.exchange(true)) {
      throw common::InvalidArgument{fmt::format(
          "Invocation of operation {} has already been ended!", _invoker.name()
      )};
    }

    InvocationOutcome outcome = token->_outcome.get();

    return std::visit(
        common::util::overloaded{
            [&outcome](Succeeded& success) -> result_t {
              return {std::move(success.value), std::move(outcome.outputs)};
            },
            [](Faulted& faulted) -> result_t { faulted.rethrow(); },
            [this](Cancelled&) -> result_t {
              throw common::OperationCancelled{
                  fmt::format("Operation {} was cancelled.", _invoker.name())};
            },
            [](Failed& failed) -> result_t { failed.rethrow(); }},
        outcome.result
    );
  }

} // namespace dispatch::invoker
