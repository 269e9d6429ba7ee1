#ifndef COSIM_CORE__PORT_HPP_
#define COSIM_CORE__PORT_HPP_

#include "cosim_core/message.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cosim_core
{

class CommunicationDevice;

enum class PortDirection
{
  INPUT,
  OUTPUT
};

class Port
{
public:
  Port(const std::string& name, PortDirection direction);
  virtual ~Port() = default;

  Port(const Port&) = delete;
  Port& operator=(const Port&) = delete;

  const std::string& getName() const { return name_; }
  PortDirection getDirection() const { return direction_; }

  void bindDevice(CommunicationDevice* device) { device_ = device; }
  CommunicationDevice* getDevice() const { return device_; }
  bool isBound() const { return device_ != nullptr; }

private:
  std::string name_;
  PortDirection direction_;
  CommunicationDevice* device_;
};

class OutputPort : public Port
{
public:
  explicit OutputPort(const std::string& name);

  // Hand the message to the bound device. Returns the delivery instant.
  // Throws UnboundPortError when no device, channel or receiver is wired.
  double send(const Message& message);

  uint64_t getMessagesSent() const { return messages_sent_; }

private:
  uint64_t messages_sent_;
};

// FIFO queue of delivered messages
class InputPort : public Port
{
public:
  using DeliveryObserver = std::function<void(const InputPort& port, const Message& message)>;
  using ObserverId = uint64_t;

  explicit InputPort(const std::string& name);

  // Append a message, notify observers and wake a blocked receiver
  void deliver(const Message& message);

  bool hasMessage() const { return !queue_.empty(); }
  size_t getQueueSize() const { return queue_.size(); }

  // Oldest queued message; throws DataError on an empty queue
  Message receive();

  std::optional<Message> tryReceive();

  // One-shot wake-up for a blocked receiver; at most one at a time
  void setWaiter(std::function<void()> waiter);
  bool hasWaiter() const { return static_cast<bool>(waiter_); }

  // Returns the id to pass to removeDeliveryObserver
  ObserverId addDeliveryObserver(DeliveryObserver observer);
  void removeDeliveryObserver(ObserverId id);

private:
  std::deque<Message> queue_;
  std::function<void()> waiter_;
  std::vector<std::pair<ObserverId, DeliveryObserver>> observers_;
  ObserverId next_observer_id_;
};

} // namespace cosim_core

#endif // COSIM_CORE__PORT_HPP_
