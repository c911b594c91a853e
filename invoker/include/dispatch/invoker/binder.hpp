#ifndef DISPATCH_INVOKER_BINDER_HPP
#define DISPATCH_INVOKER_BINDER_HPP

#include <dispatch/common/exceptions.hpp>
#include <dispatch/invoker/operation.hpp>
#include <dispatch/invoker/pending.hpp>
#include <dispatch/invoker/value.hpp>

#include <array>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <fmt/format.h>

namespace dispatch::invoker {

  struct Binder {

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Builds a new thunk for the operation, ignoring any memoized one.
    ///
    /// Every compilation of the same operation yields a behaviorally identical
    /// thunk.
    ///
    /// @param[in] operation bound operation
    /// @return fully constructed thunk
    ////////////////////////////////////////////////////////////////////////////////
    static ThunkPtr compile(const BoundOperation& operation);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Returns the memoized thunk, compiling and publishing a new one if
    /// there is none yet.
    ///
    /// Concurrent callers may compile redundantly; the last published thunk is
    /// kept. No caller ever observes a partially built thunk.
    ////////////////////////////////////////////////////////////////////////////////
    static ThunkPtr ensure_compiled(const BoundOperation& operation);
  };

  namespace detail {

    template <typename R>
    struct return_traits {
      static constexpr ReturnKind kind = ReturnKind::VALUE;
    };

    template <>
    struct return_traits<void> {
      static constexpr ReturnKind kind = ReturnKind::NONE;
    };

    template <>
    struct return_traits<Pending<void>> {
      static constexpr ReturnKind kind = ReturnKind::ASYNC_NONE;
    };

    template <typename T>
    struct return_traits<Pending<T>> {
      static constexpr ReturnKind kind = ReturnKind::ASYNC_VALUE;
    };

    // Inputs are taken by value or const reference, outputs as Out<T>&.
    template <typename Arg>
    struct slot_traits {
      static_assert(
          !std::is_lvalue_reference_v<Arg> || std::is_const_v<std::remove_reference_t<Arg>>,
          "Mutable reference parameters are not supported, declare outputs as Out<T>&"
      );

      static constexpr bool is_output = false;
      using type = std::remove_cvref_t<Arg>;
      using holder = const type&;
    };

    template <typename T>
    struct slot_traits<Out<T>&> {
      static constexpr bool is_output = true;
      using type = T;
      using holder = Out<T>;
    };

    template <typename T>
    struct slot_traits<Out<T>> {
      static constexpr bool is_output = true;
      using type = T;
      using holder = Out<T>;
    };

    // Position of each parameter within its input or output sequence.
    template <typename... Args>
    constexpr std::array<size_t, sizeof...(Args)> slot_positions()
    {
      constexpr std::array<bool, sizeof...(Args)> is_output{slot_traits<Args>::is_output...};
      std::array<size_t, sizeof...(Args)> positions{};
      size_t inputs = 0;
      size_t outputs = 0;
      for (size_t i = 0; i < sizeof...(Args); ++i) {
        positions[i] = is_output[i] ? outputs++ : inputs++;
      }
      return positions;
    }

    template <typename Arg, size_t Pos>
    typename slot_traits<Arg>::holder
    make_holder(std::span<const Value> inputs, std::span<Value> outputs)
    {
      using traits = slot_traits<Arg>;
      using type = typename traits::type;

      if constexpr (traits::is_output) {
        return typename traits::holder{outputs[Pos]};
      } else {
        const Value& value = inputs[Pos];
        if (value.type() != typeid(type)) {
          throw common::InvalidArgument{fmt::format(
              "Input parameter {} holds {}, expected {}", Pos,
              value.has_value() ? value.type().name() : "no value", typeid(type).name()
          )};
        }
        return *std::any_cast<type>(&value);
      }
    }

    template <typename R, typename... Args>
    struct SlotCaller {

      static constexpr auto positions = slot_positions<Args...>();

      template <typename Func, typename Service>
      static R call(
          const Func& func, Service& service, std::span<const Value> inputs,
          std::span<Value> outputs
      )
      {
        return _call(func, service, inputs, outputs, std::index_sequence_for<Args...>{});
      }

    private:
      template <typename Func, typename Service, size_t... I>
      static R _call(
          const Func& func, Service& service, [[maybe_unused]] std::span<const Value> inputs,
          [[maybe_unused]] std::span<Value> outputs, std::index_sequence<I...>
      )
      {
        std::tuple<typename slot_traits<Args>::holder...> holders{
            make_holder<Args, positions[I]>(inputs, outputs)...};

        return std::apply(
            [&](auto&... args) -> R { return std::invoke(func, service, args...); }, holders
        );
      }
    };

    template <typename Service, typename R, typename... Args, typename Func>
    ThunkPtr make_thunk(const Func& func)
    {
      constexpr ReturnKind kind = return_traits<R>::kind;
      using caller = SlotCaller<R, Args...>;

      return std::make_shared<const CompiledThunk>(
          kind,
          [func](void* instance, std::span<const Value> inputs, std::span<Value> outputs
          ) -> RawResult {
            auto& service = *static_cast<Service*>(instance);

            if constexpr (kind == ReturnKind::NONE) {
              caller::call(func, service, inputs, outputs);
              return std::monostate{};
            } else if constexpr (kind == ReturnKind::VALUE) {
              return Value{caller::call(func, service, inputs, outputs)};
            } else {
              R pending = caller::call(func, service, inputs, outputs);
              if (!pending.valid()) {
                throw common::InvalidState{"Operation returned an invalid pending handle!"};
              }
              return pending.state();
            }
          }
      );
    }

    template <typename Arg>
    void append_slot(Signature& signature)
    {
      using traits = slot_traits<Arg>;
      auto& slots = traits::is_output ? signature.outputs : signature.inputs;
      std::string name = std::string{traits::is_output ? "out" : "in"} + std::to_string(slots.size());
      slots.push_back(Slot{std::move(name), typeid(typename traits::type)});
    }

    template <typename Service, typename R, typename... Args>
    Signature make_signature()
    {
      Signature signature;
      signature.return_kind = return_traits<R>::kind;
      signature.service = typeid(std::remove_cv_t<Service>);
      (append_slot<Args>(signature), ...);
      return signature;
    }

    template <typename Service, typename R, typename... Args, typename Func>
    OperationPtr bind_callable(std::string name, Func func)
    {
      return std::make_shared<const BoundOperation>(
          std::move(name), make_signature<Service, R, Args...>(),
          [func = std::move(func)](const BoundOperation&) {
            return make_thunk<Service, R, Args...>(func);
          }
      );
    }

    template <typename F>
    struct callable_traits;

    template <typename C, typename R, typename Service, typename... Args>
    struct callable_traits<R (C::*)(Service&, Args...) const> {

      template <typename F>
      static OperationPtr bind(std::string name, F func)
      {
        return bind_callable<Service, R, Args...>(std::move(name), std::move(func));
      }
    };

  } // namespace detail

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Binds a member function of a service as an operation.
  ///
  /// Plain parameters become input slots, `Out<T>&` parameters become output
  /// slots. The return type selects the return kind: `void`, a value,
  /// `Pending<void>` or `Pending<T>`.
  ////////////////////////////////////////////////////////////////////////////////
  template <typename Service, typename R, typename... Args>
  OperationPtr bind(std::string name, R (Service::*method)(Args...))
  {
    return detail::bind_callable<Service, R, Args...>(std::move(name), method);
  }

  template <typename Service, typename R, typename... Args>
  OperationPtr bind(std::string name, R (Service::*method)(Args...) const)
  {
    return detail::bind_callable<const Service, R, Args...>(std::move(name), method);
  }

  // Binds a callable taking the service object as its first parameter.
  template <typename F>
  OperationPtr bind(std::string name, F func)
  {
    using traits = detail::callable_traits<decltype(&F::operator())>;
    return traits::bind(std::move(name), std::move(func));
  }

} // namespace dispatch::invoker

#endif
