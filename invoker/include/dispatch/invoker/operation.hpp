#ifndef DISPATCH_INVOKER_OPERATION_HPP
#define DISPATCH_INVOKER_OPERATION_HPP

#include <dispatch/invoker/pending.hpp>
#include <dispatch/invoker/value.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <variant>
#include <vector>

namespace dispatch::invoker {

  enum class ReturnKind { NONE = 0, VALUE, ASYNC_NONE, ASYNC_VALUE };

  std::string_view return_kind_to_string(ReturnKind kind);

  struct Slot {

    std::string name;

    // typeid(void) when the slot accepts any value.
    std::type_index type{typeid(void)};
  };

  struct Signature {

    std::vector<Slot> inputs;

    std::vector<Slot> outputs;

    ReturnKind return_kind{ReturnKind::NONE};

    // Type of the receiver; typeid(void) accepts any service object.
    std::type_index service{typeid(void)};
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Receiver of the operation, type-erased together with its static
  /// type. Null only when the dispatcher failed to produce a service object.
  ////////////////////////////////////////////////////////////////////////////////
  class Instance {
  public:
    Instance() = default;

    Instance(std::nullptr_t) {}

    template <typename Service>
    Instance(std::shared_ptr<Service> object)
        : _object(std::move(object)), _type(typeid(Service))
    {
      static_assert(
          !std::is_void_v<Service> && !std::is_const_v<Service>,
          "Service objects are passed as std::shared_ptr to a mutable class type"
      );
    }

    explicit operator bool() const
    {
      return _object != nullptr;
    }

    void* get() const
    {
      return _object.get();
    }

    std::type_index type() const
    {
      return _type;
    }

  private:
    std::shared_ptr<void> _object;
    std::type_index _type{typeid(void)};
  };

  // Result of calling a thunk: nothing, an immediate value, or a pending
  // computation.
  using RawResult = std::variant<std::monostate, Value, detail::StatePtr>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Fixed-shape adapter that calls one bound operation.
  ///
  /// Immutable after construction; shared by all invocations of the operation.
  ////////////////////////////////////////////////////////////////////////////////
  class CompiledThunk {
  public:
    using call_t =
        std::function<RawResult(void* instance, std::span<const Value>, std::span<Value>)>;

    CompiledThunk(ReturnKind kind, call_t call) : _kind(kind), _call(std::move(call)) {}

    RawResult operator()(
        void* instance, std::span<const Value> inputs, std::span<Value> outputs
    ) const
    {
      return _call(instance, inputs, outputs);
    }

    ReturnKind return_kind() const
    {
      return _kind;
    }

  private:
    ReturnKind _kind;
    call_t _call;
  };

  using ThunkPtr = std::shared_ptr<const CompiledThunk>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Immutable description of a target operation: its name, parameter
  /// layout, return kind and the compiler producing its thunk.
  ///
  /// The compiled thunk is memoized here. Publication is atomic: readers see
  /// either no thunk or a fully constructed one.
  ////////////////////////////////////////////////////////////////////////////////
  class BoundOperation {
  public:
    using compiler_t = std::function<ThunkPtr(const BoundOperation&)>;

    BoundOperation(std::string name, Signature signature, compiler_t compiler);

    BoundOperation(const BoundOperation&) = delete;
    BoundOperation& operator=(const BoundOperation&) = delete;

    const std::string& name() const
    {
      return _name;
    }

    const Signature& signature() const
    {
      return _signature;
    }

    size_t input_count() const
    {
      return _signature.inputs.size();
    }

    size_t output_count() const
    {
      return _signature.outputs.size();
    }

    ReturnKind return_kind() const
    {
      return _signature.return_kind;
    }

    bool returns_value() const;

    bool is_async() const;

    const compiler_t& compiler() const
    {
      return _compiler;
    }

    ThunkPtr thunk() const
    {
      return _thunk.load(std::memory_order_acquire);
    }

    void publish(ThunkPtr thunk) const
    {
      _thunk.store(std::move(thunk), std::memory_order_release);
    }

  private:
    std::string _name;
    Signature _signature;
    compiler_t _compiler;

    mutable std::atomic<ThunkPtr> _thunk;
  };

  using OperationPtr = std::shared_ptr<const BoundOperation>;

} // namespace dispatch::invoker

#endif
