#include "cosim_core/task_context.hpp"

namespace cosim_core
{

void TaskContext::put(const std::string& key, ContextValue value)
{
  values_[key] = std::move(value);
}

bool TaskContext::contains(const std::string& key) const
{
  return values_.find(key) != values_.end();
}

const ContextValue& TaskContext::get(const std::string& key) const
{
  auto it = values_.find(key);
  if (it == values_.end()) {
    throw MissingKeyError(key);
  }
  return it->second;
}

ContextValue TaskContext::getOr(const std::string& key, const ContextValue& default_value) const
{
  auto it = values_.find(key);
  if (it == values_.end()) {
    return default_value;
  }
  return it->second;
}

double TaskContext::getNumber(const std::string& key) const
{
  const ContextValue& value = get(key);
  if (const int64_t* integer = std::get_if<int64_t>(&value)) {
    return static_cast<double>(*integer);
  }
  if (const double* real = std::get_if<double>(&value)) {
    return *real;
  }
  throw DataError("Context key '" + key + "' does not hold a number");
}

bool TaskContext::erase(const std::string& key)
{
  return values_.erase(key) > 0;
}

void TaskContext::clear()
{
  values_.clear();
}

std::vector<std::string> TaskContext::keys() const
{
  std::vector<std::string> result;
  result.reserve(values_.size());
  for (const auto& entry : values_) {
    result.push_back(entry.first);
  }
  return result;
}

} // namespace cosim_core
