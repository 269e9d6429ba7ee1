#include "cosim_core/segments.hpp"
#include "cosim_core/errors.hpp"
#include "cosim_core/event_calendar.hpp"
#include "cosim_core/node.hpp"
#include "cosim_core/port.hpp"
#include "cosim_core/task.hpp"
#include "cosim_core/task_context.hpp"

namespace cosim_core
{

// Delay Segment Implementation

DelaySegment::DelaySegment(double delay_sec, const std::string& name)
: TaskSegment(name), delay_sec_(delay_sec)
{
  if (!(delay_sec_ >= 0.0)) {
    throw ConfigurationError("Delay segment '" + name + "' needs a non-negative delay");
  }
}

SegmentResult DelaySegment::execute(Task& /*task*/, TaskContext& /*context*/)
{
  return SegmentResult::delay(delay_sec_);
}

// Calculate Segment Implementation

CalculateSegment::CalculateSegment(const std::string& name)
: TaskSegment(name)
{
}

SegmentResult CalculateSegment::execute(Task& task, TaskContext& context)
{
  double flops = context.getNumber(FLOPS_CONTEXT_KEY);
  double iops = context.getNumber(IOPS_CONTEXT_KEY);

  Processor& processor = task.getNode().getProcessor();
  double duration = processor.computeDuration(flops, iops);

  processor.beginWork();
  return SegmentResult::delay(duration);
}

void CalculateSegment::complete(Task& task, TaskContext& /*context*/)
{
  task.getNode().getProcessor().endWork();
}

std::vector<std::string> CalculateSegment::getInputKeys() const
{
  return {FLOPS_CONTEXT_KEY, IOPS_CONTEXT_KEY};
}

// Copy Data Segment Implementation

CopyDataSegment::CopyDataSegment(const std::string& from_key, const std::string& to_key)
: TaskSegment("copy " + from_key + " -> " + to_key), from_key_(from_key), to_key_(to_key)
{
}

SegmentResult CopyDataSegment::execute(Task& /*task*/, TaskContext& context)
{
  context.put(to_key_, context.get(from_key_));
  return SegmentResult::outcome(SEGMENT_SUCCESS);
}

std::vector<std::string> CopyDataSegment::getInputKeys() const
{
  return {from_key_};
}

std::vector<std::string> CopyDataSegment::getOutputKeys() const
{
  return {to_key_};
}

// Send Segment Implementation

SendSegment::SendSegment(OutputPort& port, bool blocking, const std::string& name)
: TaskSegment(name), port_(port), blocking_(blocking)
{
}

SegmentResult SendSegment::execute(Task& task, TaskContext& context)
{
  const Message& message = context.getAs<Message>(MESSAGE_SEND_CONTEXT_KEY);
  double delivery_time = port_.send(message);

  if (blocking_) {
    return SegmentResult::delay(delivery_time - task.getCalendar().now());
  }
  return SegmentResult::outcome(SEGMENT_SUCCESS);
}

std::vector<std::string> SendSegment::getInputKeys() const
{
  return {MESSAGE_SEND_CONTEXT_KEY};
}

// Receive Segment Implementation

ReceiveSegment::ReceiveSegment(InputPort& port, bool blocking, const std::string& name)
: TaskSegment(name), port_(port), blocking_(blocking)
{
}

SegmentResult ReceiveSegment::execute(Task& /*task*/, TaskContext& context)
{
  if (port_.hasMessage()) {
    context.put(MESSAGE_RECEIVED_CONTEXT_KEY, port_.receive());
    return SegmentResult::outcome(SEGMENT_SUCCESS);
  }
  if (blocking_) {
    return SegmentResult::block(port_);
  }
  return SegmentResult::outcome(SEGMENT_FAILURE);
}

std::vector<std::string> ReceiveSegment::getOutcomes() const
{
  if (blocking_) {
    return {SEGMENT_SUCCESS};
  }
  return {SEGMENT_SUCCESS, SEGMENT_FAILURE};
}

std::vector<std::string> ReceiveSegment::getOutputKeys() const
{
  return {MESSAGE_RECEIVED_CONTEXT_KEY};
}

// Custom Segment Implementation

CustomSegment::CustomSegment(
  const std::string& name,
  Function function,
  std::vector<std::string> input_keys,
  std::vector<std::string> output_keys,
  std::vector<std::string> outcomes)
: TaskSegment(name),
  function_(std::move(function)),
  input_keys_(std::move(input_keys)),
  output_keys_(std::move(output_keys)),
  outcomes_(std::move(outcomes))
{
  if (!function_) {
    throw ConfigurationError("Custom segment '" + name + "' has no function");
  }
  if (outcomes_.empty()) {
    throw ConfigurationError("Custom segment '" + name + "' declares no outcomes");
  }
}

SegmentResult CustomSegment::execute(Task& task, TaskContext& context)
{
  return function_(task, context);
}

} // namespace cosim_core
