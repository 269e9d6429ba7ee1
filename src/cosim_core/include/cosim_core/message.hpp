#ifndef COSIM_CORE__MESSAGE_HPP_
#define COSIM_CORE__MESSAGE_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace cosim_core
{

using FieldValue = std::variant<int64_t, double, std::string>;

// Immutable message exchanged between task ports.
// The SIZE field always mirrors getSize().
class Message
{
public:
  static constexpr const char* SIZE = "SIZE";

  explicit Message(uint64_t size_bytes, std::map<std::string, FieldValue> fields = {});

  static Message createFrom(uint64_t size_bytes, std::map<std::string, FieldValue> fields = {});

  uint64_t getSize() const { return size_bytes_; }

  bool hasField(const std::string& name) const;

  // Throws DataError if the field is absent
  const FieldValue& getField(const std::string& name) const;

  const std::map<std::string, FieldValue>& getFields() const { return fields_; }

private:
  uint64_t size_bytes_;
  std::map<std::string, FieldValue> fields_;
};

} // namespace cosim_core

#endif // COSIM_CORE__MESSAGE_HPP_
