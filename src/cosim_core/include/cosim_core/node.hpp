#ifndef COSIM_CORE__NODE_HPP_
#define COSIM_CORE__NODE_HPP_

#include "cosim_core/device.hpp"
#include "cosim_core/errors.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cosim_core
{

class EventCalendar;
class NodePowerLogger;
class Task;

// Physical platform: processor, memory, battery and named peripherals.
// Device power draws of a node are attributed to its battery.
class Node
{
public:
  Node(
    EventCalendar& calendar,
    const std::string& name,
    std::unique_ptr<Processor> processor,
    std::unique_ptr<Memory> memory,
    std::unique_ptr<Battery> battery);
  ~Node() = default;

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  const std::string& getName() const { return name_; }
  EventCalendar& getCalendar() const { return calendar_; }

  Processor& getProcessor() const { return *processor_; }
  Memory& getMemory() const { return *memory_; }
  Battery& getBattery() const { return *battery_; }

  // Throws ConfigurationError on a duplicate device name
  Device& addPeripheral(std::unique_ptr<Device> peripheral);

  bool hasPeripheral(const std::string& name) const;

  // Throws ConfigurationError if absent
  Device& getPeripheral(const std::string& name) const;

  template<typename T>
  T& getPeripheralAs(const std::string& name) const
  {
    T* typed = dynamic_cast<T*>(&getPeripheral(name));
    if (!typed) {
      throw ConfigurationError("Peripheral '" + name + "' of node '" + name_ +
                               "' has another device type");
    }
    return *typed;
  }

  // Processor, memory and every peripheral
  std::vector<Device*> getDevices() const;

  // Sum of the current power draws of all devices
  double getPower() const;

  // Bind the task to this node and start its behavior
  void execute(Task& task);

  const std::vector<Task*>& getTasks() const { return tasks_; }

  // Only one power logger may drain the battery of a node.
  // Throws ConfigurationError while another logger is attached.
  void attachPowerLogger(NodePowerLogger* logger);
  void detachPowerLogger(const NodePowerLogger* logger);
  bool hasPowerLogger() const { return power_logger_ != nullptr; }

private:
  friend class Task;

  EventCalendar& calendar_;
  std::string name_;
  std::unique_ptr<Processor> processor_;
  std::unique_ptr<Memory> memory_;
  std::unique_ptr<Battery> battery_;
  std::vector<std::unique_ptr<Device>> peripherals_;
  std::map<std::string, Device*> peripherals_by_name_;
  std::vector<Task*> tasks_;
  NodePowerLogger* power_logger_;
};

} // namespace cosim_core

#endif // COSIM_CORE__NODE_HPP_
