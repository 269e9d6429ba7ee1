#ifndef COSIM_CORE__SEGMENTS_HPP_
#define COSIM_CORE__SEGMENTS_HPP_

#include "cosim_core/task_segment.hpp"
#include <functional>
#include <string>
#include <vector>

namespace cosim_core
{

class OutputPort;

// Idle wait of a fixed simulated duration
class DelaySegment : public TaskSegment
{
public:
  explicit DelaySegment(double delay_sec, const std::string& name = "delay");

  SegmentResult execute(Task& task, TaskContext& context) override;

  double getDelay() const { return delay_sec_; }

private:
  double delay_sec_;
};

// Keeps the node processor busy for FLOPS / IOPS worth of work
class CalculateSegment : public TaskSegment
{
public:
  static constexpr const char* FLOPS_CONTEXT_KEY = "FLOPS";
  static constexpr const char* IOPS_CONTEXT_KEY = "IOPS";

  explicit CalculateSegment(const std::string& name = "calculate");

  SegmentResult execute(Task& task, TaskContext& context) override;
  void complete(Task& task, TaskContext& context) override;

  std::vector<std::string> getInputKeys() const override;
};

// Copies a context value to another key in zero time
class CopyDataSegment : public TaskSegment
{
public:
  CopyDataSegment(const std::string& from_key, const std::string& to_key);

  SegmentResult execute(Task& task, TaskContext& context) override;

  std::vector<std::string> getInputKeys() const override;
  std::vector<std::string> getOutputKeys() const override;

private:
  std::string from_key_;
  std::string to_key_;
};

// Sends the message stored under MESSAGE_SEND through an output port.
// A blocking send completes when the message has been delivered.
class SendSegment : public TaskSegment
{
public:
  static constexpr const char* MESSAGE_SEND_CONTEXT_KEY = "MESSAGE_SEND";

  SendSegment(OutputPort& port, bool blocking = false, const std::string& name = "send");

  SegmentResult execute(Task& task, TaskContext& context) override;

  std::vector<std::string> getInputKeys() const override;

private:
  OutputPort& port_;
  bool blocking_;
};

// Takes the oldest message of an input port into MESSAGE_RECEIVED.
// Blocking receives park the chain; non-blocking ones report failure
// on an empty queue.
class ReceiveSegment : public TaskSegment
{
public:
  static constexpr const char* MESSAGE_RECEIVED_CONTEXT_KEY = "MESSAGE_RECEIVED";

  ReceiveSegment(InputPort& port, bool blocking = true, const std::string& name = "receive");

  SegmentResult execute(Task& task, TaskContext& context) override;

  std::vector<std::string> getOutcomes() const override;
  std::vector<std::string> getOutputKeys() const override;

private:
  InputPort& port_;
  bool blocking_;
};

// User-supplied behavior with an explicit manifest
class CustomSegment : public TaskSegment
{
public:
  using Function = std::function<SegmentResult(Task& task, TaskContext& context)>;

  CustomSegment(
    const std::string& name,
    Function function,
    std::vector<std::string> input_keys = {},
    std::vector<std::string> output_keys = {},
    std::vector<std::string> outcomes = {SEGMENT_SUCCESS});

  SegmentResult execute(Task& task, TaskContext& context) override;

  std::vector<std::string> getOutcomes() const override { return outcomes_; }
  std::vector<std::string> getInputKeys() const override { return input_keys_; }
  std::vector<std::string> getOutputKeys() const override { return output_keys_; }

private:
  Function function_;
  std::vector<std::string> input_keys_;
  std::vector<std::string> output_keys_;
  std::vector<std::string> outcomes_;
};

} // namespace cosim_core

#endif // COSIM_CORE__SEGMENTS_HPP_
