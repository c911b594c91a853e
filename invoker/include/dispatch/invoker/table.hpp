#ifndef DISPATCH_INVOKER_TABLE_HPP
#define DISPATCH_INVOKER_TABLE_HPP

#include <dispatch/invoker/operation.hpp>

#include <string>
#include <vector>

#include <tbb/concurrent_hash_map.h>

namespace dispatch::invoker {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Operations of a service keyed by name, built once at startup and
  /// shared by dispatcher threads.
  ////////////////////////////////////////////////////////////////////////////////
  class OperationTable {
  public:
    // IntelTBB concurrent hash map, keyed by operation name
    using table_t = oneapi::tbb::concurrent_hash_map<std::string, OperationPtr>;

    // Read-write lock on a single entry
    using rw_acc_t = table_t::accessor;

    // Read lock on a single entry
    using ro_acc_t = table_t::const_accessor;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Registers an operation under its name.
    ///
    /// @param[in] operation bound operation
    /// @throws ObjectExists if an operation with the same name is registered
    ////////////////////////////////////////////////////////////////////////////////
    void add(OperationPtr operation);

    // Null when the operation is unknown.
    OperationPtr get(const std::string& name) const;

    // Throws ObjectDoesNotExist when the operation is unknown.
    OperationPtr at(const std::string& name) const;

    bool remove(const std::string& name);

    size_t size() const
    {
      return _operations.size();
    }

    // Not safe to call concurrently with add or remove.
    std::vector<std::string> names() const;

  private:
    table_t _operations;
  };

} // namespace dispatch::invoker

#endif
