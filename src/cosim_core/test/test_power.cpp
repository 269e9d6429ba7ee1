#include <gtest/gtest.h>
#include "cosim_core/errors.hpp"
#include "cosim_core/loggers.hpp"
#include "cosim_core/segments.hpp"
#include "cosim_core/task.hpp"
#include "test_support.hpp"

using namespace cosim_core;

TEST(DeviceTest, UnknownModeIsRejected)
{
  Processor processor("PROCESSOR", 1.0e6, 1.0e6, test::processorModes());
  EXPECT_THROW(processor.setMode("TURBO"), UnknownModeError);
  EXPECT_EQ(processor.getMode(), "IDLE");

  EXPECT_THROW(Device("LED", {{"ON", 0.1}}, "OFF"), UnknownModeError);

  EventCalendar calendar;
  EXPECT_THROW(
    CommunicationDevice(calendar, "RADIO", ModeTable{{"IDLE", 0.0}, {"TX", 0.1}}),
    UnknownModeError);
}

TEST(DeviceTest, ModeObserverSeesPreviousMode)
{
  Device led("LED", {{"OFF", 0.0}, {"ON", 0.1}}, "OFF");
  std::string previous;
  led.addModeObserver([&previous](const Device&, const std::string& mode) { previous = mode; });

  led.setMode("ON");
  EXPECT_EQ(previous, "OFF");
  EXPECT_DOUBLE_EQ(led.getPower(), 0.1);
}

TEST(DeviceTest, ProcessorDurationCombinesBothOperationKinds)
{
  Processor processor("PROCESSOR", 2.0e6, 4.0e6, test::processorModes());
  EXPECT_DOUBLE_EQ(processor.computeDuration(8.0e6, 2.0e6), 3.0);
  EXPECT_DOUBLE_EQ(processor.computeDuration(0.0, 0.0), 0.0);
}

TEST(DeviceTest, NestedWorkKeepsProcessorBusy)
{
  Processor processor("PROCESSOR", 1.0e6, 1.0e6, test::processorModes());
  processor.beginWork();
  processor.beginWork();
  processor.endWork();
  EXPECT_EQ(processor.getMode(), "BUSY");
  processor.endWork();
  EXPECT_EQ(processor.getMode(), "IDLE");
}

TEST(BatteryTest, DrainConvertsEnergyToCharge)
{
  Battery battery("BATTERY", 3.0, 7200.0);
  EXPECT_DOUBLE_EQ(battery.drainEnergy(30.0), 10.0);
  EXPECT_DOUBLE_EQ(battery.getCharge(), 7190.0);
  EXPECT_FALSE(battery.isDepleted());
}

TEST(BatteryTest, ChargeIsClampedAtZero)
{
  Battery battery("BATTERY", 3.0, 1.0);
  int callbacks = 0;
  battery.setDepletionCallback([&callbacks](const Battery&) { callbacks++; });

  EXPECT_DOUBLE_EQ(battery.drainEnergy(30.0), 1.0);
  EXPECT_DOUBLE_EQ(battery.getCharge(), 0.0);
  EXPECT_TRUE(battery.isDepleted());

  battery.drainEnergy(30.0);
  EXPECT_EQ(callbacks, 1);
}

TEST(NodePowerLoggerTest, TransmitEnergyIsPowerTimesDuration)
{
  EventCalendar calendar;
  auto sender = test::makeNode(calendar, "sender");
  auto receiver = test::makeNode(calendar, "receiver");
  CommunicationDevice& tx = test::addRadio(calendar, *sender);
  CommunicationDevice& rx = test::addRadio(calendar, *receiver);

  auto channel = std::make_shared<DelayChannel>(100.0);
  tx.setChannel(channel);
  rx.setChannel(channel);
  rx.listen();
  OutputPort out("OUT");
  InputPort in("IN");
  tx.bind(out);
  rx.bind(in);

  NodePowerLogger sender_power(*sender);
  NodePowerLogger receiver_power(*receiver);

  out.send(Message(250));
  calendar.run();

  EXPECT_DOUBLE_EQ(calendar.now(), 2.5);
  EXPECT_NEAR(sender_power.getDeviceEnergy("RADIO"), 102e-3 * 2.5, 1e-12);
  EXPECT_NEAR(receiver_power.getDeviceEnergy("RADIO"), 49.5e-3 * 2.5, 1e-12);
}

TEST(NodePowerLoggerTest, BusyProcessorEnergyAndBatteryDrain)
{
  EventCalendar calendar;
  auto node = test::makeNode(calendar, "node");
  NodePowerLogger power(*node);

  auto task = std::make_unique<Task>("work", std::make_unique<BehaviorChain>());
  task->getBehavior().addSegment(std::make_unique<CustomSegment>(
    "load", [](Task&, TaskContext& context) {
      context.put(CalculateSegment::FLOPS_CONTEXT_KEY, 5.0e6);
      context.put(CalculateSegment::IOPS_CONTEXT_KEY, 0.0);
      return SegmentResult::outcome(SEGMENT_SUCCESS);
    },
    std::vector<std::string>{},
    std::vector<std::string>{CalculateSegment::FLOPS_CONTEXT_KEY,
                             CalculateSegment::IOPS_CONTEXT_KEY}));
  task->getBehavior().emplaceSegment<CalculateSegment>();
  node->execute(*task);

  calendar.run(5.0);
  EXPECT_NEAR(power.getDeviceEnergy("PROCESSOR"), 6.0e-3, 1e-12);

  calendar.run(100.0);
  double expected = 6.0e-3 + 1.5e-6 * 95.0;
  EXPECT_NEAR(power.getDeviceEnergy("PROCESSOR"), expected, 1e-12);
  EXPECT_NEAR(power.getEnergy(), expected, 1e-12);
  EXPECT_NEAR(node->getBattery().getCharge(), 7200.0 - expected / 3.0, 1e-9);
}

TEST(NodePowerLoggerTest, DepletionIsObservableAndSimulationContinues)
{
  EventCalendar calendar;
  auto node = test::makeNode(calendar, "node", 1.0e-3);
  int depletions = 0;
  node->getBattery().setDepletionCallback([&depletions](const Battery&) { depletions++; });
  NodePowerLogger power(*node);

  node->getProcessor().setMode("BUSY");
  bool later_event_ran = false;
  calendar.scheduleAt(10.0, [&]() { later_event_ran = true; });
  calendar.run(20.0);
  power.update();

  EXPECT_TRUE(later_event_ran);
  EXPECT_TRUE(node->getBattery().isDepleted());
  EXPECT_DOUBLE_EQ(node->getBattery().getCharge(), 0.0);
  EXPECT_EQ(depletions, 1);
  EXPECT_NEAR(power.getEnergy(), 1.2e-3 * 20.0, 1e-12);
}

TEST(NodePowerLoggerTest, SamplingRecordsPeriodicSnapshots)
{
  EventCalendar calendar;
  auto node = test::makeNode(calendar, "node");
  NodePowerLogger power(*node, 1.0);
  node->getProcessor().setMode("BUSY");

  calendar.run(3.0);
  const auto& log = power.getPowerLog();
  ASSERT_EQ(log.size(), 4u);
  EXPECT_DOUBLE_EQ(log.front().time_sec, 0.0);
  EXPECT_DOUBLE_EQ(log.back().time_sec, 3.0);
  EXPECT_NEAR(log.back().energy_j, 1.2e-3 * 3.0, 1e-12);
  EXPECT_LT(log.back().charge_c, 7200.0);

  std::string report = power.toString();
  EXPECT_NE(report.find("PROCESSOR"), std::string::npos);
}

TEST(NodeTest, PeripheralRegistry)
{
  EventCalendar calendar;
  auto node = test::makeNode(calendar, "node");
  test::addRadio(calendar, *node);

  EXPECT_TRUE(node->hasPeripheral("RADIO"));
  EXPECT_FALSE(node->hasPeripheral("LED"));
  EXPECT_EQ(node->getDevices().size(), 3u);
  EXPECT_NO_THROW(node->getPeripheralAs<CommunicationDevice>("RADIO"));
  EXPECT_THROW(node->getPeripheralAs<Processor>("RADIO"), ConfigurationError);
  EXPECT_THROW(node->getPeripheral("LED"), ConfigurationError);
  EXPECT_THROW(test::addRadio(calendar, *node), ConfigurationError);
}

TEST(NodeTest, PowerIsSumOfDeviceModes)
{
  EventCalendar calendar;
  auto node = test::makeNode(calendar, "node");
  CommunicationDevice& radio = test::addRadio(calendar, *node);

  EXPECT_DOUBLE_EQ(node->getPower(), 1.5e-6 + 0.6e-6);
  radio.setMode("TX");
  node->getProcessor().setMode("BUSY");
  EXPECT_DOUBLE_EQ(node->getPower(), 1.2e-3 + 102e-3);
}

TEST(DeviceTest, RemovedObserverIsNotNotified)
{
  Device led("LED", {{"OFF", 0.0}, {"ON", 0.1}}, "OFF");
  int kept = 0;
  int removed = 0;
  led.addModeObserver([&kept](const Device&, const std::string&) { kept++; });
  Device::ObserverId id =
    led.addModeObserver([&removed](const Device&, const std::string&) { removed++; });

  led.removeModeObserver(id);
  led.setMode("ON");
  EXPECT_EQ(kept, 1);
  EXPECT_EQ(removed, 0);
}

TEST(NodePowerLoggerTest, DestroyedLoggerStopsAccounting)
{
  EventCalendar calendar;
  auto node = test::makeNode(calendar, "node");
  {
    NodePowerLogger scoped(*node, 1.0);
  }
  EXPECT_FALSE(node->hasPowerLogger());
  EXPECT_EQ(calendar.getPendingEvents(), 0u);

  calendar.scheduleAt(1.0, [&node]() { node->getProcessor().setMode("BUSY"); });
  calendar.run(5.0);
  EXPECT_DOUBLE_EQ(node->getBattery().getCharge(), 7200.0);

  NodePowerLogger replacement(*node);
  calendar.scheduleAt(6.0, [&node]() { node->getProcessor().setMode("IDLE"); });
  calendar.run(6.0);
  EXPECT_NEAR(replacement.getDeviceEnergy("PROCESSOR"), 1.2e-3, 1e-12);
}

TEST(NodePowerLoggerTest, NodeAcceptsOnePowerLogger)
{
  EventCalendar calendar;
  auto node = test::makeNode(calendar, "node");
  NodePowerLogger power(*node);

  EXPECT_THROW({ NodePowerLogger second(*node); }, ConfigurationError);
  EXPECT_TRUE(node->hasPowerLogger());

  node->getProcessor().setMode("BUSY");
  calendar.run(10.0);
  EXPECT_NEAR(power.getEnergy(), 1.2e-3 * 10.0, 1e-12);
  EXPECT_NEAR(7200.0 - node->getBattery().getCharge(), 1.2e-3 * 10.0 / 3.0, 1e-9);
}
