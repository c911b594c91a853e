#ifndef DISPATCH_INVOKER_VALUE_HPP
#define DISPATCH_INVOKER_VALUE_HPP

#include <any>
#include <utility>
#include <vector>

namespace dispatch::invoker {

  // Argument, output and return values cross the invoker type-erased.
  // An empty value is the default value of every slot.
  using Value = std::any;

  using Values = std::vector<Value>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Writable output slot of an operation.
  ///
  /// Operations declare outputs as `Out<T>&` parameters. The slot refers to
  /// the invocation's output buffer, which stays alive until the invocation's
  /// outcome is classified.
  ////////////////////////////////////////////////////////////////////////////////
  template <typename T>
  class Out {
  public:
    using value_type = T;

    explicit Out(Value& slot) : _slot(slot) {}

    Out& operator=(T value)
    {
      _slot = std::move(value);
      return *this;
    }

    void set(T value)
    {
      _slot = std::move(value);
    }

    bool has_value() const
    {
      return _slot.has_value();
    }

    T& get()
    {
      return std::any_cast<T&>(_slot);
    }

  private:
    Value& _slot;
  };

} // namespace dispatch::invoker

#endif
