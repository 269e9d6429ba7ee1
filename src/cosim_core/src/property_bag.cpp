#include "cosim_core/property_bag.hpp"

namespace cosim_core
{

void PropertyBag::set(const std::string& name, PropertyValue value)
{
  properties_[name] = std::move(value);
}

bool PropertyBag::has(const std::string& name) const
{
  return properties_.find(name) != properties_.end();
}

const PropertyValue& PropertyBag::get(const std::string& name) const
{
  auto it = properties_.find(name);
  if (it == properties_.end()) {
    throw ConfigurationError("Unknown property: " + name);
  }
  return it->second;
}

double PropertyBag::getNumber(const std::string& name) const
{
  const PropertyValue& value = get(name);
  if (const int64_t* integer = std::get_if<int64_t>(&value)) {
    return static_cast<double>(*integer);
  }
  if (const double* real = std::get_if<double>(&value)) {
    return *real;
  }
  throw ConfigurationError("Property '" + name + "' is not a number");
}

std::vector<std::string> PropertyBag::names() const
{
  std::vector<std::string> result;
  for (const auto& entry : properties_) {
    result.push_back(entry.first);
  }
  return result;
}

} // namespace cosim_core
