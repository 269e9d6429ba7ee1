#ifndef COSIM_CORE__TASK_CONTEXT_HPP_
#define COSIM_CORE__TASK_CONTEXT_HPP_

#include "cosim_core/errors.hpp"
#include "cosim_core/message.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cosim_core
{

using Blob = std::vector<uint8_t>;
using ContextValue = std::variant<int64_t, double, std::string, Message, Blob>;

// Per-task scratch memory shared by the segments of one chain iteration.
// Only the owning task's segments touch it, strictly one at a time, so it
// carries no synchronization.
class TaskContext
{
public:
  TaskContext() = default;

  void put(const std::string& key, ContextValue value);

  bool contains(const std::string& key) const;

  // Throws MissingKeyError if absent
  const ContextValue& get(const std::string& key) const;

  ContextValue getOr(const std::string& key, const ContextValue& default_value) const;

  // Typed access; throws DataError if the stored value has another type
  template<typename T>
  const T& getAs(const std::string& key) const
  {
    const ContextValue& value = get(key);
    if (const T* typed = std::get_if<T>(&value)) {
      return *typed;
    }
    throw DataError("Context key '" + key + "' holds a value of another type");
  }

  // Accepts integer or real values
  double getNumber(const std::string& key) const;

  bool erase(const std::string& key);
  void clear();

  size_t size() const { return values_.size(); }
  std::vector<std::string> keys() const;

private:
  std::map<std::string, ContextValue> values_;
};

} // namespace cosim_core

#endif // COSIM_CORE__TASK_CONTEXT_HPP_
