#include "order_service.hpp"

#include <dispatch/invoker/binder.hpp>

#include <chrono>
#include <limits>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dispatch::cli {

  // Simulated latency of the order backend.
  constexpr std::chrono::milliseconds BACKEND_LATENCY{10};

  OrderNotFound::OrderNotFound(int order_id)
      : common::BusinessFault("OrderNotFound", fmt::format("Order {} does not exist", order_id))
  {
  }

  DivisionByZero::DivisionByZero() : common::BusinessFault("DivisionByZero", "Division by zero")
  {
  }

  ArithmeticOverflow::ArithmeticOverflow(int dividend, int divisor)
      : common::BusinessFault(
            "ArithmeticOverflow", fmt::format("{} / {} is not representable", dividend, divisor)
        )
  {
  }

  OrderService::OrderService() : _orders{{1, 250}, {2, 990}, {3, 4200}} {}

  OrderService::~OrderService()
  {
    std::lock_guard<std::mutex> lock{_mutex};
    for (auto& worker : _workers) {
      // A worker settling a promise may drop the last reference to the service.
      if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
      } else {
        worker.join();
      }
    }
  }

  int OrderService::add(int a, int b)
  {
    return a + b;
  }

  void OrderService::divide(
      int dividend, int divisor, invoker::Out<int>& quotient, invoker::Out<int>& remainder
  )
  {
    if (divisor == 0) {
      throw DivisionByZero{};
    }
    if (divisor == -1 && dividend == std::numeric_limits<int>::min()) {
      throw ArithmeticOverflow{dividend, divisor};
    }
    quotient = dividend / divisor;
    remainder = dividend % divisor;
  }

  invoker::Pending<int> OrderService::lookup(int order_id)
  {
    invoker::Promise<int> promise;

    auto it = _orders.find(order_id);
    std::optional<int> total;
    if (it != _orders.end()) {
      total = it->second;
    }

    _run_async([promise, order_id, total]() mutable {
      std::this_thread::sleep_for(BACKEND_LATENCY);
      if (order_id < 0) {
        promise.cancel();
      } else if (!total.has_value()) {
        promise.set_exception(OrderNotFound{order_id});
      } else {
        promise.set_value(total.value());
      }
    });

    return promise.pending();
  }

  invoker::Pending<void> OrderService::ship(int order_id)
  {
    if (order_id == 0) {
      throw std::runtime_error{"Shipping backend is unavailable"};
    }
    if (_orders.find(order_id) == _orders.end()) {
      return invoker::make_failed<void>(std::make_exception_ptr(OrderNotFound{order_id}));
    }

    invoker::Promise<void> promise;
    _run_async([promise, order_id]() mutable {
      std::this_thread::sleep_for(BACKEND_LATENCY);
      spdlog::debug("Order {} shipped", order_id);
      promise.set_value();
    });
    return promise.pending();
  }

  void register_operations(invoker::OperationTable& table)
  {
    table.add(invoker::bind("add", &OrderService::add));
    table.add(invoker::bind("divide", &OrderService::divide));
    table.add(invoker::bind("lookup", &OrderService::lookup));
    table.add(invoker::bind("ship", &OrderService::ship));
  }

} // namespace dispatch::cli
