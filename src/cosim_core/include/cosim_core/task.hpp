#ifndef COSIM_CORE__TASK_HPP_
#define COSIM_CORE__TASK_HPP_

#include "cosim_core/behavior_chain.hpp"
#include "cosim_core/port.hpp"
#include "cosim_core/property_bag.hpp"
#include "cosim_core/task_context.hpp"
#include <map>
#include <memory>
#include <string>

namespace cosim_core
{

class EventCalendar;
class Node;

// Unit of computational behavior: one behavior chain, named ports, properties
class Task
{
public:
  Task(const std::string& name, std::unique_ptr<BehaviorChain> behavior);
  ~Task() = default;

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  const std::string& getName() const { return name_; }

  BehaviorChain& getBehavior() { return *behavior_; }
  const BehaviorChain& getBehavior() const { return *behavior_; }

  TaskContext& getContext() { return context_; }
  const TaskContext& getContext() const { return context_; }

  PropertyBag& getProperties() { return properties_; }
  const PropertyBag& getProperties() const { return properties_; }

  OutputPort& addOutputPort(const std::string& name);
  InputPort& addInputPort(const std::string& name);

  bool hasPort(const std::string& name) const;

  // Throw ConfigurationError for unknown names or the wrong direction
  Port& port(const std::string& name);
  OutputPort& getOutputPort(const std::string& name);
  InputPort& getInputPort(const std::string& name);

  // Bind to a node (set-once) and activate the behavior chain
  void execute(Node& node);

  bool isBound() const { return node_ != nullptr; }

  // Throws ConfigurationError while unbound
  Node& getNode() const;
  EventCalendar& getCalendar() const;

private:
  std::string name_;
  std::unique_ptr<BehaviorChain> behavior_;
  TaskContext context_;
  PropertyBag properties_;
  std::map<std::string, std::unique_ptr<Port>> ports_;
  Node* node_;
};

} // namespace cosim_core

#endif // COSIM_CORE__TASK_HPP_
