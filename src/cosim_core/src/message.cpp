#include "cosim_core/message.hpp"
#include "cosim_core/errors.hpp"

namespace cosim_core
{

Message::Message(uint64_t size_bytes, std::map<std::string, FieldValue> fields)
: size_bytes_(size_bytes), fields_(std::move(fields))
{
  fields_[SIZE] = static_cast<int64_t>(size_bytes_);
}

Message Message::createFrom(uint64_t size_bytes, std::map<std::string, FieldValue> fields)
{
  return Message(size_bytes, std::move(fields));
}

bool Message::hasField(const std::string& name) const
{
  return fields_.find(name) != fields_.end();
}

const FieldValue& Message::getField(const std::string& name) const
{
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    throw DataError("Message has no field '" + name + "'");
  }
  return it->second;
}

} // namespace cosim_core
