#include "cosim_core/loggers.hpp"
#include "cosim_core/device.hpp"
#include "cosim_core/errors.hpp"
#include "cosim_core/event_calendar.hpp"
#include "cosim_core/node.hpp"
#include <iomanip>
#include <sstream>

namespace cosim_core
{

NodePowerLogger::NodePowerLogger(Node& node, double sampling_period_sec)
: node_(node),
  sampling_period_sec_(sampling_period_sec),
  start_time_sec_(node.getCalendar().now()),
  sampling_scheduled_(false),
  next_sample_(0)
{
  if (sampling_period_sec_ < 0.0) {
    throw ConfigurationError("Power sampling period must not be negative");
  }
  node_.attachPowerLogger(this);

  for (auto* device : node_.getDevices()) {
    accounts_[device] = DeviceAccount{start_time_sec_, 0.0};
    Device::ObserverId id = device->addModeObserver(
      [this](const Device& changed, const std::string& previous_mode) {
        onModeChange(changed, previous_mode);
      });
    observers_.emplace_back(device, id);
  }

  if (sampling_period_sec_ > 0.0) {
    sample();
  }
}

NodePowerLogger::~NodePowerLogger()
{
  if (sampling_scheduled_) {
    node_.getCalendar().cancel(next_sample_);
  }
  for (const auto& entry : observers_) {
    entry.first->removeModeObserver(entry.second);
  }
  node_.detachPowerLogger(this);
}

void NodePowerLogger::onModeChange(const Device& device, const std::string& previous_mode)
{
  book(device, device.getModePower(previous_mode));
}

void NodePowerLogger::book(const Device& device, double power_w)
{
  DeviceAccount& account = accounts_.at(&device);
  double now = node_.getCalendar().now();
  double energy = power_w * (now - account.last_update_sec);

  account.energy_j += energy;
  account.last_update_sec = now;
  node_.getBattery().drainEnergy(energy);
}

void NodePowerLogger::update()
{
  for (auto& entry : accounts_) {
    book(*entry.first, entry.first->getPower());
  }
}

double NodePowerLogger::getEnergy()
{
  update();
  double total = 0.0;
  for (const auto& entry : accounts_) {
    total += entry.second.energy_j;
  }
  return total;
}

double NodePowerLogger::getDeviceEnergy(const std::string& device_name)
{
  update();
  for (const auto& entry : accounts_) {
    if (entry.first->getName() == device_name) {
      return entry.second.energy_j;
    }
  }
  throw ConfigurationError("Node '" + node_.getName() + "' has no device named '" +
                           device_name + "'");
}

void NodePowerLogger::sample()
{
  double energy = getEnergy();
  power_log_.push_back(PowerSample{
    node_.getCalendar().now(),
    node_.getPower(),
    energy,
    node_.getBattery().getCharge()});

  next_sample_ = node_.getCalendar().scheduleAfter(sampling_period_sec_, [this]() { sample(); });
  sampling_scheduled_ = true;
}

std::string NodePowerLogger::toString()
{
  double energy = getEnergy();
  const Battery& battery = node_.getBattery();
  double elapsed = node_.getCalendar().now() - start_time_sec_;

  std::ostringstream out;
  out << "Power log of node '" << node_.getName() << "'\n";
  out << std::scientific << std::setprecision(6);
  out << "  elapsed:        " << elapsed << " s\n";
  out << "  total energy:   " << energy << " J\n";
  if (elapsed > 0.0) {
    out << "  average power:  " << energy / elapsed << " W\n";
  }
  out << "  battery charge: " << battery.getCharge() << " C ("
      << std::fixed << std::setprecision(4) << battery.getStateOfCharge() * 100.0 << "%)"
      << (battery.isDepleted() ? " DEPLETED" : "") << "\n";

  out << std::scientific << std::setprecision(6);
  for (const auto* device : node_.getDevices()) {
    out << "  " << device->getName() << ": " << accounts_.at(device).energy_j << " J\n";
  }
  for (const auto& s : power_log_) {
    out << "  t=" << std::fixed << std::setprecision(3) << s.time_sec
        << std::scientific << std::setprecision(6)
        << " P=" << s.power_w << " W E=" << s.energy_j << " J Q=" << s.charge_c << " C\n";
  }
  return out.str();
}

} // namespace cosim_core
