#ifndef COMPRESS_AND_SEND__SINK_TASK_HPP_
#define COMPRESS_AND_SEND__SINK_TASK_HPP_

#include "cosim_core/message.hpp"
#include "cosim_core/task.hpp"
#include <functional>
#include <memory>

namespace compress_and_send
{

constexpr const char* SINK_INPUT_PORT = "INPORT";

// Called for every message the sink consumes, with the simulated time
using MessageHandler = std::function<void(const cosim_core::Message& message, double time_sec)>;

// Loop: blocking receive, report, short pause
std::unique_ptr<cosim_core::Task> buildSinkTask(
  double pause_sec = 0.1,
  MessageHandler handler = nullptr);

} // namespace compress_and_send

#endif // COMPRESS_AND_SEND__SINK_TASK_HPP_
