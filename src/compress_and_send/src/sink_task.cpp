#include "compress_and_send/sink_task.hpp"
#include "cosim_core/event_calendar.hpp"
#include "cosim_core/segments.hpp"
#include <rclcpp/rclcpp.hpp>

namespace compress_and_send
{

using cosim_core::ReceiveSegment;
using cosim_core::SegmentResult;
using cosim_core::Task;
using cosim_core::TaskContext;

std::unique_ptr<Task> buildSinkTask(double pause_sec, MessageHandler handler)
{
  auto task = std::make_unique<Task>("SinkTask", std::make_unique<cosim_core::BehaviorChain>());
  cosim_core::InputPort& input_port = task->addInputPort(SINK_INPUT_PORT);

  cosim_core::BehaviorChain& chain = task->getBehavior();
  chain.setLooping(true);
  chain.emplaceSegment<ReceiveSegment>(input_port, true);
  chain.emplaceSegment<cosim_core::CustomSegment>(
    "report",
    [handler](Task& owner, TaskContext& context) {
      const auto& message =
        context.getAs<cosim_core::Message>(ReceiveSegment::MESSAGE_RECEIVED_CONTEXT_KEY);
      double now = owner.getCalendar().now();

      RCLCPP_INFO(rclcpp::get_logger("compress_and_send.sink"),
                  "Message received on sink at %.6f s with size %lu",
                  now, static_cast<unsigned long>(message.getSize()));
      if (handler) {
        handler(message, now);
      }
      return SegmentResult::outcome(cosim_core::SEGMENT_SUCCESS);
    },
    std::vector<std::string>{ReceiveSegment::MESSAGE_RECEIVED_CONTEXT_KEY});
  chain.emplaceSegment<cosim_core::DelaySegment>(pause_sec, "pause");

  return task;
}

} // namespace compress_and_send
