#ifndef COSIM_CORE__TASK_SEGMENT_HPP_
#define COSIM_CORE__TASK_SEGMENT_HPP_

#include <string>
#include <vector>

namespace cosim_core
{

class InputPort;
class Task;
class TaskContext;

constexpr const char* SEGMENT_SUCCESS = "success";
constexpr const char* SEGMENT_FAILURE = "failure";

// What a segment step asks the chain to do next
class SegmentResult
{
public:
  enum class Kind
  {
    OUTCOME,  // route immediately
    DELAY,    // complete after a simulated delay, then route
    BLOCK     // park until a message reaches the given port
  };

  static SegmentResult outcome(const std::string& name);
  static SegmentResult delay(double delay_sec, const std::string& outcome = SEGMENT_SUCCESS);
  static SegmentResult block(InputPort& port);

  Kind getKind() const { return kind_; }
  const std::string& getOutcome() const { return outcome_; }
  double getDelay() const { return delay_sec_; }
  InputPort* getPort() const { return port_; }

private:
  SegmentResult(Kind kind, const std::string& outcome, double delay_sec, InputPort* port);

  Kind kind_;
  std::string outcome_;
  double delay_sec_;
  InputPort* port_;
};

// Base class for the atomic steps of a task behavior
class TaskSegment
{
public:
  explicit TaskSegment(const std::string& name);
  virtual ~TaskSegment() = default;

  // Run one step against the task's context
  virtual SegmentResult execute(Task& task, TaskContext& context) = 0;

  // Invoked when the delay requested by execute() has elapsed
  virtual void complete(Task& task, TaskContext& context);

  // Outcomes this segment may produce; each must be routed by the chain
  virtual std::vector<std::string> getOutcomes() const;

  // Context manifest checked before simulated time starts
  virtual std::vector<std::string> getInputKeys() const;
  virtual std::vector<std::string> getOutputKeys() const;

  const std::string& getName() const { return name_; }

private:
  std::string name_;
};

} // namespace cosim_core

#endif // COSIM_CORE__TASK_SEGMENT_HPP_
