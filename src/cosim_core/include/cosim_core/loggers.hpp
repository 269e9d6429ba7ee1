#ifndef COSIM_CORE__LOGGERS_HPP_
#define COSIM_CORE__LOGGERS_HPP_

#include "cosim_core/device.hpp"
#include "cosim_core/event_calendar.hpp"
#include "cosim_core/port.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cosim_core
{

class Node;

struct PowerSample
{
  double time_sec;
  double power_w;     // node power at the sample instant
  double energy_j;    // cumulative energy since the logger started
  double charge_c;    // remaining battery charge
};

// Integrates the power of every device of a node and drains its battery.
// Energy of an interval is exactly power(mode) x duration; it is booked on
// every mode change and whenever the logger is queried or samples.
// Create it after the node has all of its peripherals; a node accepts one
// logger at a time, which must not outlive the node or its calendar.
class NodePowerLogger
{
public:
  explicit NodePowerLogger(Node& node, double sampling_period_sec = 0.0);
  ~NodePowerLogger();

  NodePowerLogger(const NodePowerLogger&) = delete;
  NodePowerLogger& operator=(const NodePowerLogger&) = delete;

  // Book the energy of all devices up to the current simulated time
  void update();

  // Cumulative energy up to now
  double getEnergy();
  double getDeviceEnergy(const std::string& device_name);

  const std::vector<PowerSample>& getPowerLog() const { return power_log_; }

  std::string toString();

private:
  struct DeviceAccount
  {
    double last_update_sec;
    double energy_j;
  };

  void onModeChange(const Device& device, const std::string& previous_mode);
  void book(const Device& device, double power_w);
  void sample();

  Node& node_;
  double sampling_period_sec_;
  double start_time_sec_;
  std::map<const Device*, DeviceAccount> accounts_;
  std::vector<std::pair<Device*, Device::ObserverId>> observers_;
  std::vector<PowerSample> power_log_;
  bool sampling_scheduled_;
  EventHandle next_sample_;
};

// Counts the messages delivered to an input port
class MessageCountLogger
{
public:
  explicit MessageCountLogger(InputPort& port);
  ~MessageCountLogger();

  MessageCountLogger(const MessageCountLogger&) = delete;
  MessageCountLogger& operator=(const MessageCountLogger&) = delete;

  uint64_t getMessageCount() const { return message_count_; }
  uint64_t getTotalBytes() const { return total_bytes_; }

private:
  InputPort& port_;
  InputPort::ObserverId observer_;
  uint64_t message_count_;
  uint64_t total_bytes_;
};

} // namespace cosim_core

#endif // COSIM_CORE__LOGGERS_HPP_
