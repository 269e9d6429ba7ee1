#include "cosim_core/device.hpp"
#include "cosim_core/errors.hpp"
#include <rclcpp/rclcpp.hpp>
#include <algorithm>

namespace cosim_core
{

// Device Implementation

Device::Device(const std::string& name, const ModeTable& modes, const std::string& initial_mode)
: name_(name), modes_(modes), mode_(initial_mode), next_observer_id_(0)
{
  if (modes_.empty()) {
    throw ConfigurationError("Device '" + name_ + "' has no modes");
  }
  for (const auto& entry : modes_) {
    if (entry.second < 0.0) {
      throw ConfigurationError(
        "Device '" + name_ + "' mode '" + entry.first + "' has negative power");
    }
  }
  requireMode(initial_mode);
}

bool Device::hasMode(const std::string& mode) const
{
  return modes_.find(mode) != modes_.end();
}

void Device::requireMode(const std::string& mode) const
{
  if (!hasMode(mode)) {
    throw UnknownModeError(name_, mode);
  }
}

void Device::setMode(const std::string& mode)
{
  requireMode(mode);
  if (mode == mode_) {
    return;
  }

  std::string previous = mode_;
  mode_ = mode;
  for (const auto& entry : observers_) {
    entry.second(*this, previous);
  }
}

double Device::getPower() const
{
  return modes_.at(mode_);
}

double Device::getModePower(const std::string& mode) const
{
  requireMode(mode);
  return modes_.at(mode);
}

Device::ObserverId Device::addModeObserver(ModeObserver observer)
{
  ObserverId id = next_observer_id_++;
  observers_.emplace_back(id, std::move(observer));
  return id;
}

void Device::removeModeObserver(ObserverId id)
{
  observers_.erase(
    std::remove_if(observers_.begin(), observers_.end(),
                   [id](const auto& entry) { return entry.first == id; }),
    observers_.end());
}

// Processor Implementation

Processor::Processor(
  const std::string& name,
  double iops_per_sec,
  double flops_per_sec,
  const ModeTable& modes,
  const std::string& idle_mode,
  const std::string& busy_mode)
: Device(name, modes, idle_mode),
  iops_per_sec_(iops_per_sec),
  flops_per_sec_(flops_per_sec),
  idle_mode_(idle_mode),
  busy_mode_(busy_mode),
  active_work_(0)
{
  if (iops_per_sec_ <= 0.0 || flops_per_sec_ <= 0.0) {
    throw ConfigurationError("Processor '" + name + "' needs positive throughput");
  }
  requireMode(busy_mode_);
}

double Processor::computeDuration(double flops, double iops) const
{
  if (flops < 0.0 || iops < 0.0) {
    throw DataError("Negative operation count for processor '" + getName() + "'");
  }
  return flops / flops_per_sec_ + iops / iops_per_sec_;
}

void Processor::beginWork()
{
  if (active_work_++ == 0) {
    setMode(busy_mode_);
  }
}

void Processor::endWork()
{
  if (active_work_ == 0) {
    return;
  }
  if (--active_work_ == 0) {
    setMode(idle_mode_);
  }
}

// Memory Implementation

Memory::Memory(const std::string& name, uint64_t capacity_bytes)
: Device(name, ModeTable{{"IDLE", 0.0}}, "IDLE"), capacity_bytes_(capacity_bytes)
{
}

Memory::Memory(const std::string& name, uint64_t capacity_bytes,
               const ModeTable& modes, const std::string& initial_mode)
: Device(name, modes, initial_mode), capacity_bytes_(capacity_bytes)
{
}

// Battery Implementation

Battery::Battery(const std::string& name, double potential_v, double charge_c)
: name_(name),
  potential_v_(potential_v),
  charge_c_(charge_c),
  initial_charge_c_(charge_c),
  depleted_(charge_c <= 0.0)
{
  if (potential_v_ <= 0.0) {
    throw ConfigurationError("Battery '" + name_ + "' needs a positive potential");
  }
  if (charge_c_ < 0.0) {
    throw ConfigurationError("Battery '" + name_ + "' has negative charge");
  }
}

double Battery::getStateOfCharge() const
{
  if (initial_charge_c_ <= 0.0) {
    return 0.0;
  }
  return charge_c_ / initial_charge_c_;
}

double Battery::drainEnergy(double energy_j)
{
  if (energy_j <= 0.0 || depleted_) {
    return 0.0;
  }

  double removed = std::min(charge_c_, energy_j / potential_v_);
  charge_c_ -= removed;

  if (charge_c_ <= 0.0) {
    charge_c_ = 0.0;
    depleted_ = true;
    RCLCPP_WARN(rclcpp::get_logger("cosim_core.battery"),
                "Battery '%s' depleted", name_.c_str());
    if (depletion_callback_) {
      depletion_callback_(*this);
    }
  }
  return removed;
}

void Battery::setDepletionCallback(DepletionCallback callback)
{
  depletion_callback_ = std::move(callback);
}

} // namespace cosim_core
