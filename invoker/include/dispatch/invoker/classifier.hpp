#ifndef DISPATCH_INVOKER_CLASSIFIER_HPP
#define DISPATCH_INVOKER_CLASSIFIER_HPP

#include <dispatch/invoker/outcome.hpp>
#include <dispatch/invoker/pending.hpp>

#include <exception>
#include <string_view>

namespace dispatch::invoker {

  struct FailureClassifier {

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Maps a settled computation to its terminal outcome.
    ///
    /// Priority: business fault, then cancellation, then any other error, then
    /// success. Succeeded never carries the value, the caller extracts it once
    /// success is known. Pure and deterministic.
    ///
    /// @param[in] operation name used for the context of wrapped failures
    /// @param[in] settled computation, must not be pending
    /// @return classified outcome
    ////////////////////////////////////////////////////////////////////////////////
    static Outcome classify(std::string_view operation, const detail::SharedState& settled);

    // Wraps the cause into an InvocationFailure nesting it.
    static std::exception_ptr wrap(std::string_view operation, const std::exception_ptr& cause);
  };

} // namespace dispatch::invoker

#endif
