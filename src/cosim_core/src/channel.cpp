#include "cosim_core/channel.hpp"
#include "cosim_core/communication_device.hpp"
#include "cosim_core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace cosim_core
{

void Channel::attach(CommunicationDevice* device)
{
  if (std::find(devices_.begin(), devices_.end(), device) != devices_.end()) {
    return;
  }
  if (devices_.size() >= MAX_DEVICES) {
    throw ConfigurationError(
      "Channel already links '" + devices_[0]->getName() + "' and '" +
      devices_[1]->getName() + "'; cannot attach '" + device->getName() + "'");
  }
  devices_.push_back(device);
}

void Channel::detach(CommunicationDevice* device)
{
  devices_.erase(std::remove(devices_.begin(), devices_.end(), device), devices_.end());
}

std::vector<CommunicationDevice*> Channel::getReceivers(const CommunicationDevice* sender) const
{
  std::vector<CommunicationDevice*> receivers;
  for (auto* device : devices_) {
    if (device != sender && device->isListening() && device->getInputPort() != nullptr) {
      receivers.push_back(device);
    }
  }
  return receivers;
}

DelayChannel::DelayChannel(double bandwidth_bytes_per_sec, double propagation_delay_sec)
: bandwidth_bytes_per_sec_(bandwidth_bytes_per_sec),
  propagation_delay_sec_(propagation_delay_sec)
{
  if (!(bandwidth_bytes_per_sec_ > 0.0) || std::isinf(bandwidth_bytes_per_sec_)) {
    throw ConfigurationError("Channel bandwidth must be positive and finite");
  }
  if (propagation_delay_sec_ < 0.0) {
    throw ConfigurationError("Channel propagation delay must not be negative");
  }
}

double DelayChannel::transmissionDelay(uint64_t size_bytes) const
{
  return propagation_delay_sec_ + static_cast<double>(size_bytes) / bandwidth_bytes_per_sec_;
}

} // namespace cosim_core
