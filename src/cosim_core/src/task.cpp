#include "cosim_core/task.hpp"
#include "cosim_core/errors.hpp"
#include "cosim_core/node.hpp"

namespace cosim_core
{

Task::Task(const std::string& name, std::unique_ptr<BehaviorChain> behavior)
: name_(name), behavior_(std::move(behavior)), node_(nullptr)
{
  if (!behavior_) {
    throw ConfigurationError("Task '" + name_ + "' needs a behavior chain");
  }
}

OutputPort& Task::addOutputPort(const std::string& name)
{
  if (hasPort(name)) {
    throw ConfigurationError("Task '" + name_ + "' already has a port named '" + name + "'");
  }
  auto port = std::make_unique<OutputPort>(name);
  OutputPort& ref = *port;
  ports_[name] = std::move(port);
  return ref;
}

InputPort& Task::addInputPort(const std::string& name)
{
  if (hasPort(name)) {
    throw ConfigurationError("Task '" + name_ + "' already has a port named '" + name + "'");
  }
  auto port = std::make_unique<InputPort>(name);
  InputPort& ref = *port;
  ports_[name] = std::move(port);
  return ref;
}

bool Task::hasPort(const std::string& name) const
{
  return ports_.find(name) != ports_.end();
}

Port& Task::port(const std::string& name)
{
  auto it = ports_.find(name);
  if (it == ports_.end()) {
    throw ConfigurationError("Task '" + name_ + "' has no port named '" + name + "'");
  }
  return *it->second;
}

OutputPort& Task::getOutputPort(const std::string& name)
{
  Port& p = port(name);
  if (p.getDirection() != PortDirection::OUTPUT) {
    throw ConfigurationError("Port '" + name + "' of task '" + name_ + "' is not an output");
  }
  return static_cast<OutputPort&>(p);
}

InputPort& Task::getInputPort(const std::string& name)
{
  Port& p = port(name);
  if (p.getDirection() != PortDirection::INPUT) {
    throw ConfigurationError("Port '" + name + "' of task '" + name_ + "' is not an input");
  }
  return static_cast<InputPort&>(p);
}

void Task::execute(Node& node)
{
  if (node_) {
    throw ConfigurationError(
      "Task '" + name_ + "' is already bound to node '" + node_->getName() + "'");
  }
  node_ = &node;
  try {
    behavior_->activate(*this);
  } catch (const std::exception&) {
    node_ = nullptr;
    throw;
  }
  node.tasks_.push_back(this);
}

Node& Task::getNode() const
{
  if (!node_) {
    throw ConfigurationError("Task '" + name_ + "' is not bound to a node");
  }
  return *node_;
}

EventCalendar& Task::getCalendar() const
{
  return getNode().getCalendar();
}

} // namespace cosim_core
