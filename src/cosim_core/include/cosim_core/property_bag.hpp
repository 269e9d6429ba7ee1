#ifndef COSIM_CORE__PROPERTY_BAG_HPP_
#define COSIM_CORE__PROPERTY_BAG_HPP_

#include "cosim_core/errors.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cosim_core
{

using PropertyValue = std::variant<int64_t, double, std::string>;

// Free-form task parameters (algorithm choice, workload sizes, ...)
class PropertyBag
{
public:
  void set(const std::string& name, PropertyValue value);

  bool has(const std::string& name) const;

  // Throws ConfigurationError if absent
  const PropertyValue& get(const std::string& name) const;

  template<typename T>
  const T& getAs(const std::string& name) const
  {
    const PropertyValue& value = get(name);
    if (const T* typed = std::get_if<T>(&value)) {
      return *typed;
    }
    throw ConfigurationError("Property '" + name + "' holds a value of another type");
  }

  // Accepts integer or real values
  double getNumber(const std::string& name) const;

  std::vector<std::string> names() const;

private:
  std::map<std::string, PropertyValue> properties_;
};

} // namespace cosim_core

#endif // COSIM_CORE__PROPERTY_BAG_HPP_
