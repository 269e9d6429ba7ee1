#ifndef COSIM_CORE__CHANNEL_HPP_
#define COSIM_CORE__CHANNEL_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cosim_core
{

class CommunicationDevice;

// Point-to-point link between two communication devices, so that every
// message has exactly one receiver
class Channel
{
public:
  static constexpr size_t MAX_DEVICES = 2;

  virtual ~Channel() = default;

  // Time needed to move a message of the given size across the channel
  virtual double transmissionDelay(uint64_t size_bytes) const = 0;

  // Throws ConfigurationError when both ends are already taken
  void attach(CommunicationDevice* device);
  void detach(CommunicationDevice* device);

  const std::vector<CommunicationDevice*>& getDevices() const { return devices_; }

  // The other end when it listens and has a bound input port; empty otherwise
  std::vector<CommunicationDevice*> getReceivers(const CommunicationDevice* sender) const;

private:
  std::vector<CommunicationDevice*> devices_;
};

// Delay = propagation + size / bandwidth
class DelayChannel : public Channel
{
public:
  explicit DelayChannel(double bandwidth_bytes_per_sec, double propagation_delay_sec = 0.0);

  double transmissionDelay(uint64_t size_bytes) const override;

  double getBandwidth() const { return bandwidth_bytes_per_sec_; }
  double getPropagationDelay() const { return propagation_delay_sec_; }

private:
  double bandwidth_bytes_per_sec_;
  double propagation_delay_sec_;
};

} // namespace cosim_core

#endif // COSIM_CORE__CHANNEL_HPP_
