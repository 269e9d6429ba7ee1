#include "compress_and_send/sample_nodes.hpp"
#include "cosim_core/communication_device.hpp"

namespace compress_and_send
{

using cosim_core::ModeTable;

namespace
{

// Processor throughput (operations per second)
constexpr double INTEGER_OPS_PER_SEC = 4.0323e6;
constexpr double FLOATING_OPS_PER_SEC = 16.129e6;

// Two 1.5 V cells in series, ~2000 mAh
constexpr double BATTERY_POTENTIAL_V = 3.0;
constexpr double BATTERY_CHARGE_C = 7200.0;

ModeTable processorModes()
{
  return ModeTable{
    {"IDLE", 1.5e-6},
    {"BUSY", 1.2e-3}};
}

ModeTable radioModes()
{
  return ModeTable{
    {"IDLE", 0.6e-6},
    {"TX", 102e-3},
    {"RX", 49.5e-3}};
}

std::unique_ptr<cosim_core::Node> buildRadioNode(
  cosim_core::EventCalendar& calendar, const std::string& name)
{
  auto processor = std::make_unique<cosim_core::Processor>(
    "PROCESSOR", INTEGER_OPS_PER_SEC, FLOATING_OPS_PER_SEC, processorModes(), "IDLE");
  auto memory = std::make_unique<cosim_core::Memory>("MEMORY");
  auto battery = std::make_unique<cosim_core::Battery>(
    "BATTERY", BATTERY_POTENTIAL_V, BATTERY_CHARGE_C);

  auto node = std::make_unique<cosim_core::Node>(
    calendar, name, std::move(processor), std::move(memory), std::move(battery));
  node->addPeripheral(std::make_unique<cosim_core::CommunicationDevice>(
    calendar, COMM_DEVICE_NAME, radioModes(), "IDLE"));
  return node;
}

} // namespace

std::unique_ptr<cosim_core::Node> buildSampleAndCompressNode(cosim_core::EventCalendar& calendar)
{
  return buildRadioNode(calendar, "SampleAndCompressNode");
}

std::unique_ptr<cosim_core::Node> buildSinkNode(cosim_core::EventCalendar& calendar)
{
  return buildRadioNode(calendar, "SinkNode");
}

} // namespace compress_and_send
