#include "compress_and_send/scenario.hpp"
#include "compress_and_send/sample_nodes.hpp"
#include "compress_and_send/sink_task.hpp"
#include "cosim_core/channel.hpp"
#include "cosim_core/event_calendar.hpp"
#include <rclcpp/rclcpp.hpp>

namespace compress_and_send
{

ScenarioResult runCompressAndSend(const ScenarioConfig& config)
{
  auto logger = rclcpp::get_logger("compress_and_send.scenario");

  if (config.simulation_seconds < 0.0) {
    throw cosim_core::ConfigurationError("Simulation time must not be negative");
  }

  cosim_core::EventCalendar calendar;

  // Functional view
  auto sample_task = buildSampleAndCompressTask(config.task);
  auto sink_task = buildSinkTask();

  // Physical view
  auto sample_node = buildSampleAndCompressNode(calendar);
  auto sink_node = buildSinkNode(calendar);

  auto& sample_radio =
    sample_node->getPeripheralAs<cosim_core::CommunicationDevice>(COMM_DEVICE_NAME);
  auto& sink_radio =
    sink_node->getPeripheralAs<cosim_core::CommunicationDevice>(COMM_DEVICE_NAME);

  auto channel = std::make_shared<cosim_core::DelayChannel>(config.channel_bandwidth_bytes_per_sec);
  sample_radio.setChannel(channel);
  sample_radio.setDeliveryOrder(config.delivery_order);
  sink_radio.setChannel(channel);
  sink_radio.listen();

  // Mapping view
  sample_radio.bind(sample_task->getOutputPort(SAMPLE_OUTPUT_PORT));
  sink_radio.bind(sink_task->getInputPort(SINK_INPUT_PORT));

  cosim_core::MessageCountLogger message_count_logger(sink_task->getInputPort(SINK_INPUT_PORT));
  cosim_core::NodePowerLogger sample_power_logger(*sample_node, config.power_sampling_period_sec);
  cosim_core::NodePowerLogger sink_power_logger(*sink_node);

  sample_node->execute(*sample_task);
  sink_node->execute(*sink_task);

  RCLCPP_INFO(logger,
              "Running compress-and-send for %.1f s (algorithm=%s, percentage=%.1f)",
              config.simulation_seconds,
              toString(config.task.compression_algorithm),
              config.task.compression_percentage);

  calendar.run(config.simulation_seconds);

  ScenarioResult result;
  result.messages_sent = sample_radio.getMessagesSent();
  result.messages_received = message_count_logger.getMessageCount();
  result.bytes_received = message_count_logger.getTotalBytes();
  result.sensor_energy_j = sample_power_logger.getEnergy();
  result.sink_energy_j = sink_power_logger.getEnergy();
  result.sensor_charge_c = sample_node->getBattery().getCharge();
  result.sensor_battery_depleted = sample_node->getBattery().isDepleted();
  result.power_log = sample_power_logger.getPowerLog();
  result.power_report = sample_power_logger.toString();

  RCLCPP_INFO(logger, "Total number of messages received: %lu",
              static_cast<unsigned long>(result.messages_received));
  return result;
}

} // namespace compress_and_send
