#ifndef DISPATCH_INVOKER_TESTS_SERVICES_HPP
#define DISPATCH_INVOKER_TESTS_SERVICES_HPP

#include <dispatch/common/exceptions.hpp>
#include <dispatch/invoker/binder.hpp>
#include <dispatch/invoker/operation.hpp>
#include <dispatch/invoker/pending.hpp>
#include <dispatch/invoker/value.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

using namespace dispatch::invoker;
namespace common = dispatch::common;

struct OrderNotFound : common::BusinessFault {

  OrderNotFound(int id)
      : common::BusinessFault("OrderNotFound", fmt::format("Order {} does not exist", id)),
        order_id(id)
  {
  }

  int order_id;
};

struct TestService {

  std::atomic<int> calls{0};

  Promise<int> pending_value;
  Promise<void> pending_void;

  int sum(int a, int b)
  {
    ++calls;
    return a + b;
  }

  Pending<int> sum_async(int a, int b)
  {
    ++calls;
    return make_ready(a + b);
  }

  Pending<int> deferred(int, int)
  {
    ++calls;
    return pending_value.pending();
  }

  Pending<void> deferred_void()
  {
    ++calls;
    return pending_void.pending();
  }

  void split(int value, Out<int>& high, Out<int>& low)
  {
    ++calls;
    high = value / 100;
    low = value % 100;
  }

  Pending<int> find_order(int id, Out<std::string>& status)
  {
    ++calls;
    status = "searched";
    return make_failed<int>(std::make_exception_ptr(OrderNotFound{id}));
  }

  Pending<int> reserve(int, Out<std::string>& status, Out<int>&)
  {
    ++calls;
    status = "reserved";
    return make_cancelled<int>();
  }

  Pending<int> deferred_lookup(int, Out<std::string>& status)
  {
    ++calls;
    status = "pending";
    return pending_value.pending();
  }

  Pending<void> withdraw(int)
  {
    ++calls;
    return make_cancelled<void>();
  }

  void reject(int id)
  {
    ++calls;
    throw OrderNotFound{id};
  }

  int explode(int)
  {
    ++calls;
    throw std::runtime_error{"boom"};
  }

  std::string greet(const std::string& name) const
  {
    return "Hello, " + name;
  }
};

struct OtherService {

  int sum(int a, int b)
  {
    return a + b;
  }
};

// Operation adding two integers, counting compilations and calls.
inline OperationPtr
counting_operation(std::atomic<int>& compilations, std::atomic<int>& calls)
{
  Signature signature{
      {Slot{"a", typeid(int)}, Slot{"b", typeid(int)}}, {}, ReturnKind::VALUE};

  return std::make_shared<const BoundOperation>(
      "counted", std::move(signature),
      [&compilations, &calls](const BoundOperation&) {
        ++compilations;
        return std::make_shared<const CompiledThunk>(
            ReturnKind::VALUE,
            [&calls](void*, std::span<const Value> inputs, std::span<Value>) -> RawResult {
              ++calls;
              return Value{std::any_cast<int>(inputs[0]) + std::any_cast<int>(inputs[1])};
            }
        );
      }
  );
}

inline Values make_inputs(std::initializer_list<int> values)
{
  Values inputs;
  for (int val : values) {
    inputs.emplace_back(val);
  }
  return inputs;
}

#endif
