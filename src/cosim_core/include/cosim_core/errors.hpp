#ifndef COSIM_CORE__ERRORS_HPP_
#define COSIM_CORE__ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace cosim_core
{

// Model authored incorrectly; raised at construction, binding or validation time
class ConfigurationError : public std::runtime_error
{
public:
  explicit ConfigurationError(const std::string& what)
  : std::runtime_error(what) {}
};

// Routing table or context manifest of a behavior chain does not resolve
class MalformedChainError : public ConfigurationError
{
public:
  explicit MalformedChainError(const std::string& what)
  : ConfigurationError(what) {}
};

class UnknownModeError : public ConfigurationError
{
public:
  UnknownModeError(const std::string& device_name, const std::string& mode)
  : ConfigurationError("Unknown mode '" + mode + "' for device '" + device_name + "'"),
    device_name_(device_name), mode_(mode) {}

  const std::string& getDeviceName() const { return device_name_; }
  const std::string& getMode() const { return mode_; }

private:
  std::string device_name_;
  std::string mode_;
};

// Port, device or channel wiring missing at send time
class UnboundPortError : public ConfigurationError
{
public:
  explicit UnboundPortError(const std::string& what)
  : ConfigurationError(what) {}
};

// Unexpected data inside a task activation; fails only the offending chain
class DataError : public std::runtime_error
{
public:
  explicit DataError(const std::string& what)
  : std::runtime_error(what) {}
};

class MissingKeyError : public DataError
{
public:
  explicit MissingKeyError(const std::string& key)
  : DataError("Missing context key: " + key), key_(key) {}

  const std::string& getKey() const { return key_; }

private:
  std::string key_;
};

} // namespace cosim_core

#endif // COSIM_CORE__ERRORS_HPP_
