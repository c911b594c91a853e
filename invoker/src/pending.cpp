#include <dispatch/invoker/pending.hpp>

#include <dispatch/common/exceptions.hpp>

namespace dispatch::invoker::detail {

  void SharedState::settle_value(Value&& value)
  {
    _settle(Settlement::VALUE, std::move(value), nullptr);
  }

  void SharedState::settle_error(std::exception_ptr error)
  {
    if (!error) {
      throw common::InvalidArgument{"Cannot settle a computation with an empty error!"};
    }
    _settle(Settlement::ERROR, Value{}, std::move(error));
  }

  void SharedState::settle_cancelled()
  {
    _settle(Settlement::CANCELLED, Value{}, nullptr);
  }

  void SharedState::_settle(Settlement settlement, Value&& value, std::exception_ptr error)
  {
    std::vector<continuation_t> continuations;
    {
      std::lock_guard<std::mutex> lock{_mutex};
      if (_settlement != Settlement::PENDING) {
        throw common::InvalidState{"Computation has already been settled!"};
      }
      _value = std::move(value);
      _error = std::move(error);
      _settlement = settlement;
      continuations.swap(_continuations);
    }
    _cv.notify_all();

    // Run outside of the lock - continuations may inspect the state.
    for (auto& continuation : continuations) {
      continuation();
    }
  }

  Settlement SharedState::settlement() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _settlement;
  }

  bool SharedState::settled() const
  {
    return settlement() != Settlement::PENDING;
  }

  void SharedState::wait() const
  {
    std::unique_lock<std::mutex> lock{_mutex};
    _cv.wait(lock, [this]() { return _settlement != Settlement::PENDING; });
  }

  void SharedState::on_settled(continuation_t&& continuation)
  {
    {
      std::lock_guard<std::mutex> lock{_mutex};
      if (_settlement == Settlement::PENDING) {
        _continuations.push_back(std::move(continuation));
        return;
      }
    }
    continuation();
  }

  const Value& SharedState::value() const
  {
    _require_settled();
    return _value;
  }

  const std::exception_ptr& SharedState::error() const
  {
    _require_settled();
    return _error;
  }

  void SharedState::_require_settled() const
  {
    if (!settled()) {
      throw common::InvalidState{"Computation has not been settled yet!"};
    }
  }

  std::shared_ptr<SharedState> SharedState::make_value(Value&& value)
  {
    auto state = std::make_shared<SharedState>();
    state->settle_value(std::move(value));
    return state;
  }

  std::shared_ptr<SharedState> SharedState::make_error(std::exception_ptr error)
  {
    auto state = std::make_shared<SharedState>();
    state->settle_error(std::move(error));
    return state;
  }

} // namespace dispatch::invoker::detail
