#include <rclcpp/rclcpp.hpp>
#include "compress_and_send/compression_models.hpp"
#include "compress_and_send/scenario.hpp"
#include "cosim/msg/scenario_report.hpp"
#include <memory>
#include <string>

class CompressAndSendNode : public rclcpp::Node
{
public:
  CompressAndSendNode()
  : Node("compress_and_send_node")
  {
    // Declare parameters
    this->declare_parameter("compression_algorithm", std::string("ZIP"));
    this->declare_parameter("compression_percentage", 20.0);
    this->declare_parameter("average_package_size_bytes", 110.0);
    this->declare_parameter("sdeviation_package_size_bytes", 0.0);
    this->declare_parameter("sampling_interval_sec", 5.0);
    this->declare_parameter("random_seed", 42);
    this->declare_parameter("channel_bandwidth_bytes_per_sec", 110.0);
    this->declare_parameter("simulation_seconds", 100.0);
    this->declare_parameter("power_sampling_period_sec", 10.0);
    this->declare_parameter("delivery_order", std::string("send"));

    config_.task.compression_algorithm = compress_and_send::parseCompressionAlgorithm(
      this->get_parameter("compression_algorithm").as_string());
    config_.task.compression_percentage =
      this->get_parameter("compression_percentage").as_double();
    config_.task.average_package_size_bytes =
      this->get_parameter("average_package_size_bytes").as_double();
    config_.task.sdeviation_package_size_bytes =
      this->get_parameter("sdeviation_package_size_bytes").as_double();
    config_.task.sampling_interval_sec =
      this->get_parameter("sampling_interval_sec").as_double();
    config_.task.random_seed =
      static_cast<uint32_t>(this->get_parameter("random_seed").as_int());
    config_.channel_bandwidth_bytes_per_sec =
      this->get_parameter("channel_bandwidth_bytes_per_sec").as_double();
    config_.simulation_seconds = this->get_parameter("simulation_seconds").as_double();
    config_.power_sampling_period_sec =
      this->get_parameter("power_sampling_period_sec").as_double();

    std::string order = this->get_parameter("delivery_order").as_string();
    if (order == "arrival") {
      config_.delivery_order = cosim_core::DeliveryOrder::ARRIVAL_ORDER;
    } else if (order != "send") {
      RCLCPP_WARN(this->get_logger(),
                  "Unknown delivery order '%s', using send order", order.c_str());
    }

    // Latched so that late subscribers still get the result of the run
    report_pub_ = this->create_publisher<cosim::msg::ScenarioReport>(
      "compress_and_send/report", rclcpp::QoS(1).transient_local());

    RCLCPP_INFO(this->get_logger(), "Compress and Send Node started");
  }

  int run()
  {
    try {
      auto result = compress_and_send::runCompressAndSend(config_);

      RCLCPP_INFO(this->get_logger(),
                  "Messages sent: %lu, received: %lu (%lu bytes)",
                  static_cast<unsigned long>(result.messages_sent),
                  static_cast<unsigned long>(result.messages_received),
                  static_cast<unsigned long>(result.bytes_received));
      RCLCPP_INFO(this->get_logger(),
                  "Sensor energy: %.6e J, sink energy: %.6e J, sensor charge left: %.3f C%s",
                  result.sensor_energy_j, result.sink_energy_j, result.sensor_charge_c,
                  result.sensor_battery_depleted ? " (depleted)" : "");
      RCLCPP_INFO(this->get_logger(), "%s", result.power_report.c_str());

      publishReport(result);
      return 0;
    } catch (const std::exception& e) {
      RCLCPP_ERROR(this->get_logger(), "Simulation failed: %s", e.what());
      return 1;
    }
  }

private:
  void publishReport(const compress_and_send::ScenarioResult& result)
  {
    auto msg = cosim::msg::ScenarioReport();
    msg.compression_algorithm = compress_and_send::toString(config_.task.compression_algorithm);
    msg.compression_percentage = config_.task.compression_percentage;
    msg.simulation_seconds = config_.simulation_seconds;
    msg.messages_sent = result.messages_sent;
    msg.messages_received = result.messages_received;
    msg.bytes_received = result.bytes_received;
    msg.sensor_energy_j = result.sensor_energy_j;
    msg.sink_energy_j = result.sink_energy_j;
    msg.sensor_charge_c = result.sensor_charge_c;
    msg.sensor_battery_depleted = result.sensor_battery_depleted;

    for (const auto& sample : result.power_log) {
      cosim::msg::PowerSample entry;
      entry.time_sec = sample.time_sec;
      entry.power_w = sample.power_w;
      entry.energy_j = sample.energy_j;
      entry.charge_c = sample.charge_c;
      msg.power_log.push_back(entry);
    }

    report_pub_->publish(msg);
  }

  compress_and_send::ScenarioConfig config_;
  rclcpp::Publisher<cosim::msg::ScenarioReport>::SharedPtr report_pub_;
};

int main(int argc, char * argv[])
{
  rclcpp::init(argc, argv);
  int status = std::make_shared<CompressAndSendNode>()->run();
  rclcpp::shutdown();
  return status;
}
