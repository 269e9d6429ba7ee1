#include "cosim_core/node.hpp"
#include "cosim_core/task.hpp"
#include <rclcpp/rclcpp.hpp>

namespace cosim_core
{

Node::Node(
  EventCalendar& calendar,
  const std::string& name,
  std::unique_ptr<Processor> processor,
  std::unique_ptr<Memory> memory,
  std::unique_ptr<Battery> battery)
: calendar_(calendar),
  name_(name),
  processor_(std::move(processor)),
  memory_(std::move(memory)),
  battery_(std::move(battery)),
  power_logger_(nullptr)
{
  if (!processor_ || !memory_ || !battery_) {
    throw ConfigurationError("Node '" + name_ + "' needs a processor, a memory and a battery");
  }
  if (processor_->getName() == memory_->getName()) {
    throw ConfigurationError("Node '" + name_ + "' has two devices named '" +
                             processor_->getName() + "'");
  }
}

Device& Node::addPeripheral(std::unique_ptr<Device> peripheral)
{
  if (!peripheral) {
    throw ConfigurationError("Cannot add a null peripheral to node '" + name_ + "'");
  }
  const std::string& device_name = peripheral->getName();
  if (hasPeripheral(device_name) ||
      device_name == processor_->getName() ||
      device_name == memory_->getName())
  {
    throw ConfigurationError("Node '" + name_ + "' already has a device named '" +
                             device_name + "'");
  }

  Device& ref = *peripheral;
  peripherals_by_name_[device_name] = &ref;
  peripherals_.push_back(std::move(peripheral));
  return ref;
}

bool Node::hasPeripheral(const std::string& name) const
{
  return peripherals_by_name_.find(name) != peripherals_by_name_.end();
}

Device& Node::getPeripheral(const std::string& name) const
{
  auto it = peripherals_by_name_.find(name);
  if (it == peripherals_by_name_.end()) {
    throw ConfigurationError("Node '" + name_ + "' has no peripheral named '" + name + "'");
  }
  return *it->second;
}

std::vector<Device*> Node::getDevices() const
{
  std::vector<Device*> devices{processor_.get(), memory_.get()};
  for (const auto& peripheral : peripherals_) {
    devices.push_back(peripheral.get());
  }
  return devices;
}

double Node::getPower() const
{
  double total = 0.0;
  for (const auto* device : getDevices()) {
    total += device->getPower();
  }
  return total;
}

void Node::execute(Task& task)
{
  RCLCPP_INFO(rclcpp::get_logger("cosim_core.node"),
              "Node '%s' executing task '%s'", name_.c_str(), task.getName().c_str());
  task.execute(*this);
}

void Node::attachPowerLogger(NodePowerLogger* logger)
{
  if (power_logger_ && power_logger_ != logger) {
    throw ConfigurationError("Node '" + name_ + "' already has a power logger");
  }
  power_logger_ = logger;
}

void Node::detachPowerLogger(const NodePowerLogger* logger)
{
  if (power_logger_ == logger) {
    power_logger_ = nullptr;
  }
}

} // namespace cosim_core
