#ifndef DISPATCH_INVOKER_PENDING_HPP
#define DISPATCH_INVOKER_PENDING_HPP

#include <dispatch/common/exceptions.hpp>
#include <dispatch/invoker/value.hpp>

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace dispatch::invoker {

  enum class Settlement { PENDING = 0, VALUE, ERROR, CANCELLED };

  namespace detail {

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Shared state of an asynchronous computation.
    ///
    /// Moves from PENDING to exactly one terminal settlement. Continuations
    /// registered before settlement run on the settling thread, continuations
    /// registered afterwards run immediately on the registering thread.
    /// Value and error are immutable once settled.
    ////////////////////////////////////////////////////////////////////////////////
    class SharedState {
    public:
      using continuation_t = std::function<void()>;

      void settle_value(Value&& value);

      void settle_error(std::exception_ptr error);

      void settle_cancelled();

      Settlement settlement() const;

      bool settled() const;

      void wait() const;

      void on_settled(continuation_t&& continuation);

      // Both accessors require a settled state.
      const Value& value() const;
      const std::exception_ptr& error() const;

      static std::shared_ptr<SharedState> make_value(Value&& value);

      static std::shared_ptr<SharedState> make_error(std::exception_ptr error);

    private:
      void _settle(Settlement settlement, Value&& value, std::exception_ptr error);

      void _require_settled() const;

      mutable std::mutex _mutex;
      mutable std::condition_variable _cv;

      Settlement _settlement{Settlement::PENDING};
      Value _value;
      std::exception_ptr _error;

      std::vector<continuation_t> _continuations;
    };

    using StatePtr = std::shared_ptr<SharedState>;

  } // namespace detail

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Handle to an asynchronous computation that eventually produces a
  /// value of type T, an error, or a cancellation.
  ///
  /// Copies share the same computation. A default-constructed handle is not
  /// valid.
  ////////////////////////////////////////////////////////////////////////////////
  template <typename T>
  class Pending {
  public:
    using value_type = T;

    Pending() = default;

    explicit Pending(detail::StatePtr state) : _state(std::move(state)) {}

    bool valid() const
    {
      return _state != nullptr;
    }

    bool is_settled() const
    {
      return _require_valid().settled();
    }

    Settlement settlement() const
    {
      return _require_valid().settlement();
    }

    void wait() const
    {
      _require_valid().wait();
    }

    template <typename F>
    void then(F&& func) const
    {
      _require_valid().on_settled(std::forward<F>(func));
    }

    // Blocks until settled. Rethrows the stored error, throws
    // OperationCancelled for a cancelled computation.
    T get() const
    {
      const auto& state = _require_valid();
      state.wait();

      switch (state.settlement()) {
      case Settlement::ERROR:
        std::rethrow_exception(state.error());
      case Settlement::CANCELLED:
        throw common::OperationCancelled{};
      default:
        break;
      }

      if constexpr (!std::is_void_v<T>) {
        return std::any_cast<T>(state.value());
      }
    }

    const detail::StatePtr& state() const
    {
      return _state;
    }

  private:
    detail::SharedState& _require_valid() const
    {
      if (!_state) {
        throw common::InvalidState{"Access to an invalid pending handle!"};
      }
      return *_state;
    }

    detail::StatePtr _state;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Producer side of a Pending<T>. Settles the computation exactly once;
  /// a second settlement throws InvalidState.
  ////////////////////////////////////////////////////////////////////////////////
  template <typename T>
  class Promise {
  public:
    Promise() : _state(std::make_shared<detail::SharedState>()) {}

    Pending<T> pending() const
    {
      return Pending<T>{_state};
    }

    template <typename... Args>
    void set_value(Args&&... args)
    {
      if constexpr (std::is_void_v<T>) {
        static_assert(sizeof...(Args) == 0, "Pending<void> settles without a value");
        _state->settle_value(Value{});
      } else {
        _state->settle_value(Value{T(std::forward<Args>(args)...)});
      }
    }

    void set_exception(std::exception_ptr error)
    {
      _state->settle_error(std::move(error));
    }

    template <typename E>
    void set_exception(E&& error)
    {
      _state->settle_error(std::make_exception_ptr(std::forward<E>(error)));
    }

    void cancel()
    {
      _state->settle_cancelled();
    }

  private:
    detail::StatePtr _state;
  };

  template <typename T>
  Pending<std::decay_t<T>> make_ready(T&& value)
  {
    return Pending<std::decay_t<T>>{
        detail::SharedState::make_value(Value{std::forward<T>(value)})};
  }

  inline Pending<void> make_ready()
  {
    return Pending<void>{detail::SharedState::make_value(Value{})};
  }

  template <typename T>
  Pending<T> make_failed(std::exception_ptr error)
  {
    return Pending<T>{detail::SharedState::make_error(std::move(error))};
  }

  template <typename T>
  Pending<T> make_cancelled()
  {
    Promise<T> promise;
    promise.cancel();
    return promise.pending();
  }

} // namespace dispatch::invoker

#endif
