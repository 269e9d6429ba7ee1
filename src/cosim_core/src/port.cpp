#include "cosim_core/port.hpp"
#include "cosim_core/communication_device.hpp"
#include "cosim_core/errors.hpp"
#include <algorithm>

namespace cosim_core
{

Port::Port(const std::string& name, PortDirection direction)
: name_(name), direction_(direction), device_(nullptr)
{
}

// OutputPort Implementation

OutputPort::OutputPort(const std::string& name)
: Port(name, PortDirection::OUTPUT), messages_sent_(0)
{
}

double OutputPort::send(const Message& message)
{
  if (!isBound()) {
    throw UnboundPortError("Output port '" + getName() + "' is not bound to a device");
  }
  double delivery_time = getDevice()->transmit(message);
  messages_sent_++;
  return delivery_time;
}

// InputPort Implementation

InputPort::InputPort(const std::string& name)
: Port(name, PortDirection::INPUT), next_observer_id_(0)
{
}

void InputPort::deliver(const Message& message)
{
  queue_.push_back(message);

  for (const auto& entry : observers_) {
    entry.second(*this, message);
  }

  if (waiter_) {
    auto waiter = std::move(waiter_);
    waiter_ = nullptr;
    waiter();
  }
}

Message InputPort::receive()
{
  if (queue_.empty()) {
    throw DataError("Input port '" + getName() + "' has no message");
  }
  Message message = queue_.front();
  queue_.pop_front();
  return message;
}

std::optional<Message> InputPort::tryReceive()
{
  if (queue_.empty()) {
    return std::nullopt;
  }
  return receive();
}

void InputPort::setWaiter(std::function<void()> waiter)
{
  if (waiter_) {
    throw ConfigurationError("Input port '" + getName() + "' already has a blocked receiver");
  }
  waiter_ = std::move(waiter);
}

InputPort::ObserverId InputPort::addDeliveryObserver(DeliveryObserver observer)
{
  ObserverId id = next_observer_id_++;
  observers_.emplace_back(id, std::move(observer));
  return id;
}

void InputPort::removeDeliveryObserver(ObserverId id)
{
  observers_.erase(
    std::remove_if(observers_.begin(), observers_.end(),
                   [id](const auto& entry) { return entry.first == id; }),
    observers_.end());
}

} // namespace cosim_core
