#include <dispatch/invoker/table.hpp>

#include <dispatch/common/exceptions.hpp>

#include <algorithm>

#include <fmt/format.h>

namespace dispatch::invoker {

  void OperationTable::add(OperationPtr operation)
  {
    if (!operation) {
      throw common::InvalidArgument{"Cannot register an empty operation!"};
    }

    rw_acc_t acc;
    bool inserted = _operations.insert(acc, operation->name());
    if (!inserted) {
      throw common::ObjectExists{operation->name()};
    }
    acc->second = std::move(operation);
  }

  OperationPtr OperationTable::get(const std::string& name) const
  {
    ro_acc_t acc;
    if (!_operations.find(acc, name)) {
      return nullptr;
    }
    return acc->second;
  }

  OperationPtr OperationTable::at(const std::string& name) const
  {
    auto operation = get(name);
    if (!operation) {
      throw common::ObjectDoesNotExist{fmt::format("Unknown operation {}", name)};
    }
    return operation;
  }

  bool OperationTable::remove(const std::string& name)
  {
    return _operations.erase(name);
  }

  std::vector<std::string> OperationTable::names() const
  {
    std::vector<std::string> result;
    result.reserve(_operations.size());
    for (const auto& [name, operation] : _operations) {
      result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
  }

} // namespace dispatch::invoker
