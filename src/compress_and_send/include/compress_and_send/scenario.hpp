#ifndef COMPRESS_AND_SEND__SCENARIO_HPP_
#define COMPRESS_AND_SEND__SCENARIO_HPP_

#include "compress_and_send/sample_and_compress_task.hpp"
#include "cosim_core/communication_device.hpp"
#include "cosim_core/loggers.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace compress_and_send
{

struct ScenarioConfig
{
  SampleAndCompressConfig task;
  double channel_bandwidth_bytes_per_sec;
  double simulation_seconds;
  double power_sampling_period_sec;   // 0 disables the sampled power log
  cosim_core::DeliveryOrder delivery_order;

  ScenarioConfig()
  : channel_bandwidth_bytes_per_sec(110.0),
    simulation_seconds(100.0),
    power_sampling_period_sec(10.0),
    delivery_order(cosim_core::DeliveryOrder::SEND_ORDER) {}
};

struct ScenarioResult
{
  uint64_t messages_sent;
  uint64_t messages_received;
  uint64_t bytes_received;
  double sensor_energy_j;
  double sink_energy_j;
  double sensor_charge_c;
  bool sensor_battery_depleted;
  std::vector<cosim_core::PowerSample> power_log;
  std::string power_report;
};

// Wire a sensor node and a sink node over one channel and run the
// simulation up to config.simulation_seconds
ScenarioResult runCompressAndSend(const ScenarioConfig& config);

} // namespace compress_and_send

#endif // COMPRESS_AND_SEND__SCENARIO_HPP_
