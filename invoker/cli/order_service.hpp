#ifndef DISPATCH_INVOKER_CLI_ORDER_SERVICE_HPP
#define DISPATCH_INVOKER_CLI_ORDER_SERVICE_HPP

#include <dispatch/common/exceptions.hpp>
#include <dispatch/invoker/pending.hpp>
#include <dispatch/invoker/table.hpp>
#include <dispatch/invoker/value.hpp>

#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace dispatch::cli {

  struct OrderNotFound : common::BusinessFault {

    OrderNotFound(int order_id);
  };

  struct DivisionByZero : common::BusinessFault {

    DivisionByZero();
  };

  struct ArithmeticOverflow : common::BusinessFault {

    ArithmeticOverflow(int dividend, int divisor);
  };

  // Demonstration service with one operation of each return kind.
  class OrderService {
  public:
    OrderService();

    OrderService(const OrderService&) = delete;
    OrderService& operator=(const OrderService&) = delete;

    ~OrderService();

    int add(int a, int b);

    void divide(int dividend, int divisor, invoker::Out<int>& quotient, invoker::Out<int>& remainder);

    // Total of the order. Negative identifiers withdraw the request.
    invoker::Pending<int> lookup(int order_id);

    // Order 0 reaches an unavailable shipping backend.
    invoker::Pending<void> ship(int order_id);

  private:
    template <typename F>
    void _run_async(F&& func)
    {
      std::lock_guard<std::mutex> lock{_mutex};
      _workers.emplace_back(std::forward<F>(func));
    }

    std::mutex _mutex;
    std::vector<std::thread> _workers;

    std::unordered_map<int, int> _orders;
  };

  void register_operations(invoker::OperationTable& table);

} // namespace dispatch::cli

#endif
