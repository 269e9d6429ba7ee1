#include "cosim_core/task_segment.hpp"
#include "cosim_core/errors.hpp"
#include <cmath>

namespace cosim_core
{

SegmentResult::SegmentResult(Kind kind, const std::string& outcome, double delay_sec, InputPort* port)
: kind_(kind), outcome_(outcome), delay_sec_(delay_sec), port_(port)
{
}

SegmentResult SegmentResult::outcome(const std::string& name)
{
  return SegmentResult(Kind::OUTCOME, name, 0.0, nullptr);
}

SegmentResult SegmentResult::delay(double delay_sec, const std::string& outcome)
{
  if (std::isnan(delay_sec) || delay_sec < 0.0) {
    throw DataError("Segment requested an invalid delay: " + std::to_string(delay_sec));
  }
  return SegmentResult(Kind::DELAY, outcome, delay_sec, nullptr);
}

SegmentResult SegmentResult::block(InputPort& port)
{
  return SegmentResult(Kind::BLOCK, "", 0.0, &port);
}

TaskSegment::TaskSegment(const std::string& name)
: name_(name)
{
}

void TaskSegment::complete(Task& /*task*/, TaskContext& /*context*/)
{
}

std::vector<std::string> TaskSegment::getOutcomes() const
{
  return {SEGMENT_SUCCESS};
}

std::vector<std::string> TaskSegment::getInputKeys() const
{
  return {};
}

std::vector<std::string> TaskSegment::getOutputKeys() const
{
  return {};
}

} // namespace cosim_core
