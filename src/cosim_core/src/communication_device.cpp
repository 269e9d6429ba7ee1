#include "cosim_core/communication_device.hpp"
#include "cosim_core/errors.hpp"
#include <rclcpp/rclcpp.hpp>
#include <algorithm>

namespace cosim_core
{

CommunicationDevice::CommunicationDevice(
  EventCalendar& calendar,
  const std::string& name,
  const ModeTable& modes,
  const std::string& initial_mode)
: Device(name, modes, initial_mode),
  calendar_(calendar),
  output_port_(nullptr),
  input_port_(nullptr),
  listening_(false),
  delivery_order_(DeliveryOrder::SEND_ORDER),
  busy_until_sec_(0.0),
  active_transmissions_(0),
  active_receptions_(0),
  messages_sent_(0),
  messages_received_(0)
{
  requireMode(IDLE_MODE);
  requireMode(TX_MODE);
  requireMode(RX_MODE);
}

CommunicationDevice::~CommunicationDevice()
{
  if (channel_) {
    channel_->detach(this);
  }
}

void CommunicationDevice::setChannel(std::shared_ptr<Channel> channel)
{
  if (channel) {
    channel->attach(this);
  }
  if (channel_ && channel_ != channel) {
    channel_->detach(this);
  }
  channel_ = std::move(channel);
}

void CommunicationDevice::bind(OutputPort& port)
{
  output_port_ = &port;
  port.bindDevice(this);
}

void CommunicationDevice::bind(InputPort& port)
{
  input_port_ = &port;
  port.bindDevice(this);
}

double CommunicationDevice::transmit(const Message& message)
{
  if (!channel_) {
    throw UnboundPortError("Device '" + getName() + "' has no channel");
  }

  auto receivers = channel_->getReceivers(this);
  if (receivers.empty()) {
    throw UnboundPortError(
      "No listening receiver with a bound input port on the channel of '" + getName() + "'");
  }

  double now = calendar_.now();
  double start = now;
  if (delivery_order_ == DeliveryOrder::SEND_ORDER) {
    start = std::max(now, busy_until_sec_);
  }
  double end = start + channel_->transmissionDelay(message.getSize());
  busy_until_sec_ = std::max(busy_until_sec_, end);

  if (start <= now) {
    beginTransmission(receivers);
  } else {
    calendar_.scheduleAt(start, [this, receivers]() {
      beginTransmission(receivers);
    });
  }

  calendar_.scheduleAt(end, [this, receivers, message]() {
    endTransmission(receivers, message);
  });

  messages_sent_++;
  RCLCPP_DEBUG(rclcpp::get_logger("cosim_core.communication_device"),
               "%s: sending %lu bytes at %.6f, delivery at %.6f",
               getName().c_str(), static_cast<unsigned long>(message.getSize()), start, end);
  return end;
}

void CommunicationDevice::beginTransmission(const std::vector<CommunicationDevice*>& receivers)
{
  active_transmissions_++;
  updateMode();
  for (auto* receiver : receivers) {
    receiver->beginReception();
  }
}

void CommunicationDevice::endTransmission(
  const std::vector<CommunicationDevice*>& receivers,
  const Message& message)
{
  active_transmissions_--;
  updateMode();
  for (auto* receiver : receivers) {
    receiver->endReception(message);
  }
}

void CommunicationDevice::beginReception()
{
  active_receptions_++;
  updateMode();
}

void CommunicationDevice::endReception(const Message& message)
{
  active_receptions_--;
  updateMode();
  messages_received_++;
  if (input_port_) {
    input_port_->deliver(message);
  }
}

void CommunicationDevice::updateMode()
{
  if (active_transmissions_ > 0) {
    setMode(TX_MODE);
  } else if (active_receptions_ > 0) {
    setMode(RX_MODE);
  } else {
    setMode(IDLE_MODE);
  }
}

} // namespace cosim_core
