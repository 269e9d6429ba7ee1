#ifndef COSIM_CORE__COMMUNICATION_DEVICE_HPP_
#define COSIM_CORE__COMMUNICATION_DEVICE_HPP_

#include "cosim_core/channel.hpp"
#include "cosim_core/device.hpp"
#include "cosim_core/event_calendar.hpp"
#include "cosim_core/message.hpp"
#include "cosim_core/port.hpp"
#include <memory>
#include <string>

namespace cosim_core
{

// How concurrent sends from one radio reach the receivers
enum class DeliveryOrder
{
  SEND_ORDER,     // transmissions are serialized; receivers see send order
  ARRIVAL_ORDER   // transmissions overlap; shorter messages may overtake
};

// Radio-like peripheral: TX while transmitting, RX while receiving, IDLE otherwise
class CommunicationDevice : public Device
{
public:
  static constexpr const char* IDLE_MODE = "IDLE";
  static constexpr const char* TX_MODE = "TX";
  static constexpr const char* RX_MODE = "RX";

  CommunicationDevice(
    EventCalendar& calendar,
    const std::string& name,
    const ModeTable& modes,
    const std::string& initial_mode = IDLE_MODE);
  ~CommunicationDevice() override;

  void setChannel(std::shared_ptr<Channel> channel);
  std::shared_ptr<Channel> getChannel() const { return channel_; }

  // Only listening devices accept deliveries from their channel
  void listen() { listening_ = true; }
  void stopListening() { listening_ = false; }
  bool isListening() const { return listening_; }

  void bind(OutputPort& port);
  void bind(InputPort& port);
  OutputPort* getOutputPort() const { return output_port_; }
  InputPort* getInputPort() const { return input_port_; }

  void setDeliveryOrder(DeliveryOrder order) { delivery_order_ = order; }
  DeliveryOrder getDeliveryOrder() const { return delivery_order_; }

  // Start transmitting a message to every receiver on the channel.
  // Returns the simulated instant at which it is delivered.
  double transmit(const Message& message);

  uint64_t getMessagesSent() const { return messages_sent_; }
  uint64_t getMessagesReceived() const { return messages_received_; }

private:
  void beginTransmission(const std::vector<CommunicationDevice*>& receivers);
  void endTransmission(
    const std::vector<CommunicationDevice*>& receivers,
    const Message& message);

  void beginReception();
  void endReception(const Message& message);

  // Mode follows the active transfers: TX wins over RX, IDLE when none
  void updateMode();

  EventCalendar& calendar_;
  std::shared_ptr<Channel> channel_;
  OutputPort* output_port_;
  InputPort* input_port_;

  bool listening_;
  DeliveryOrder delivery_order_;
  double busy_until_sec_;

  int active_transmissions_;
  int active_receptions_;

  uint64_t messages_sent_;
  uint64_t messages_received_;
};

} // namespace cosim_core

#endif // COSIM_CORE__COMMUNICATION_DEVICE_HPP_
