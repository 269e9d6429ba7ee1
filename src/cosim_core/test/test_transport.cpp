#include <gtest/gtest.h>
#include "cosim_core/channel.hpp"
#include "cosim_core/errors.hpp"
#include "cosim_core/loggers.hpp"
#include "cosim_core/segments.hpp"
#include "cosim_core/task.hpp"
#include "test_support.hpp"
#include <vector>

using namespace cosim_core;

namespace
{

Message sequenced(uint64_t size_bytes, int64_t sequence)
{
  return Message(size_bytes, {{"SEQ", sequence}});
}

// Sender and receiver nodes whose radios share one channel
class LinkTest : public ::testing::Test
{
protected:
  LinkTest()
  : sender_node_(test::makeNode(calendar_, "sender")),
    receiver_node_(test::makeNode(calendar_, "receiver")),
    sender_radio_(test::addRadio(calendar_, *sender_node_)),
    receiver_radio_(test::addRadio(calendar_, *receiver_node_)),
    channel_(std::make_shared<DelayChannel>(100.0)),
    out_("OUT"),
    in_("IN")
  {
    sender_radio_.setChannel(channel_);
    receiver_radio_.setChannel(channel_);
    receiver_radio_.listen();
    sender_radio_.bind(out_);
    receiver_radio_.bind(in_);
  }

  std::vector<int64_t> drainSequence()
  {
    std::vector<int64_t> order;
    while (in_.hasMessage()) {
      order.push_back(std::get<int64_t>(in_.receive().getField("SEQ")));
    }
    return order;
  }

  EventCalendar calendar_;
  std::unique_ptr<Node> sender_node_;
  std::unique_ptr<Node> receiver_node_;
  CommunicationDevice& sender_radio_;
  CommunicationDevice& receiver_radio_;
  std::shared_ptr<DelayChannel> channel_;
  OutputPort out_;
  InputPort in_;
};

} // namespace

TEST(DelayChannelTest, DelayGrowsWithSizeAndShrinksWithBandwidth)
{
  DelayChannel slow(100.0);
  DelayChannel fast(1000.0);

  double previous = -1.0;
  for (uint64_t size : {0u, 1u, 10u, 100u, 1000u, 100000u}) {
    double delay = slow.transmissionDelay(size);
    EXPECT_GE(delay, previous);
    EXPECT_LE(fast.transmissionDelay(size), delay);
    previous = delay;
  }
  EXPECT_DOUBLE_EQ(slow.transmissionDelay(250), 2.5);
}

TEST(DelayChannelTest, RejectsNonPositiveBandwidth)
{
  EXPECT_THROW(DelayChannel(0.0), ConfigurationError);
  EXPECT_THROW(DelayChannel(-5.0), ConfigurationError);
}

TEST_F(LinkTest, DeliveryHappensAfterChannelDelay)
{
  double delivery = out_.send(sequenced(150, 1));
  EXPECT_DOUBLE_EQ(delivery, 1.5);

  calendar_.run(1.0);
  EXPECT_FALSE(in_.hasMessage());

  calendar_.run();
  ASSERT_TRUE(in_.hasMessage());
  EXPECT_EQ(in_.receive().getSize(), 150u);
  EXPECT_EQ(receiver_radio_.getMessagesReceived(), 1u);
}

TEST_F(LinkTest, RadiosTransmitAndReceiveForTheTransferDuration)
{
  out_.send(sequenced(100, 1));
  EXPECT_EQ(sender_radio_.getMode(), "TX");
  EXPECT_EQ(receiver_radio_.getMode(), "RX");

  calendar_.run();
  EXPECT_EQ(sender_radio_.getMode(), "IDLE");
  EXPECT_EQ(receiver_radio_.getMode(), "IDLE");
}

TEST_F(LinkTest, SendOrderPolicyPreservesSendOrder)
{
  sender_radio_.setDeliveryOrder(DeliveryOrder::SEND_ORDER);
  out_.send(sequenced(300, 1));
  out_.send(sequenced(100, 2));
  double last = out_.send(sequenced(200, 3));

  EXPECT_DOUBLE_EQ(last, 6.0);
  calendar_.run();
  EXPECT_EQ(drainSequence(), (std::vector<int64_t>{1, 2, 3}));
}

TEST_F(LinkTest, ArrivalOrderPolicyLetsShortMessagesOvertake)
{
  sender_radio_.setDeliveryOrder(DeliveryOrder::ARRIVAL_ORDER);
  out_.send(sequenced(300, 1));
  out_.send(sequenced(100, 2));
  out_.send(sequenced(200, 3));

  calendar_.run();
  EXPECT_EQ(drainSequence(), (std::vector<int64_t>{2, 3, 1}));
}

TEST_F(LinkTest, EqualDelaysKeepSendOrderUnderEitherPolicy)
{
  sender_radio_.setDeliveryOrder(DeliveryOrder::ARRIVAL_ORDER);
  for (int64_t i = 0; i < 5; ++i) {
    out_.send(sequenced(0, i));
  }

  calendar_.run();
  EXPECT_EQ(drainSequence(), (std::vector<int64_t>{0, 1, 2, 3, 4}));
}

TEST_F(LinkTest, MessageCountLoggerCountsDeliveries)
{
  MessageCountLogger counter(in_);
  out_.send(sequenced(10, 1));
  out_.send(sequenced(20, 2));
  calendar_.run();

  EXPECT_EQ(counter.getMessageCount(), 2u);
  EXPECT_EQ(counter.getTotalBytes(), 30u);
}

TEST_F(LinkTest, UnboundPortFailsAtSendTime)
{
  OutputPort loose("LOOSE");
  EXPECT_THROW(loose.send(Message(10)), UnboundPortError);
}

TEST_F(LinkTest, MissingReceiverFailsAtSendTime)
{
  receiver_radio_.stopListening();
  EXPECT_THROW(out_.send(Message(10)), UnboundPortError);
}

TEST_F(LinkTest, DeviceWithoutChannelFailsAtSendTime)
{
  sender_radio_.setChannel(nullptr);
  EXPECT_THROW(out_.send(Message(10)), UnboundPortError);
}

TEST_F(LinkTest, BlockingReceiveWakesOnDelivery)
{
  auto sender = std::make_unique<Task>("sender", std::make_unique<BehaviorChain>());
  auto receiver = std::make_unique<Task>("receiver", std::make_unique<BehaviorChain>());
  OutputPort& tx_port = sender->addOutputPort("OUT");
  InputPort& rx_port = receiver->addInputPort("IN");
  sender_radio_.bind(tx_port);
  receiver_radio_.bind(rx_port);

  sender->getBehavior().emplaceSegment<DelaySegment>(2.0);
  sender->getBehavior().addSegment(std::make_unique<CustomSegment>(
    "prepare", [](Task&, TaskContext& context) {
      context.put(SendSegment::MESSAGE_SEND_CONTEXT_KEY, Message(100));
      return SegmentResult::outcome(SEGMENT_SUCCESS);
    },
    std::vector<std::string>{},
    std::vector<std::string>{SendSegment::MESSAGE_SEND_CONTEXT_KEY}));
  sender->getBehavior().emplaceSegment<SendSegment>(tx_port, true);

  double received_at = -1.0;
  receiver->getBehavior().emplaceSegment<ReceiveSegment>(rx_port, true);
  receiver->getBehavior().addSegment(std::make_unique<CustomSegment>(
    "record", [&](Task& owner, TaskContext& context) {
      context.getAs<Message>(ReceiveSegment::MESSAGE_RECEIVED_CONTEXT_KEY);
      received_at = owner.getCalendar().now();
      return SegmentResult::outcome(SEGMENT_SUCCESS);
    },
    std::vector<std::string>{ReceiveSegment::MESSAGE_RECEIVED_CONTEXT_KEY}));

  receiver_node_->execute(*receiver);
  sender_node_->execute(*sender);

  calendar_.run(1.0);
  EXPECT_EQ(receiver->getBehavior().getState(), ChainState::BLOCKED);
  EXPECT_TRUE(rx_port.hasWaiter());

  calendar_.run();
  EXPECT_DOUBLE_EQ(received_at, 3.0);
  EXPECT_EQ(sender->getBehavior().getState(), ChainState::TERMINATED);
  EXPECT_EQ(receiver->getBehavior().getState(), ChainState::TERMINATED);
  EXPECT_FALSE(rx_port.hasMessage());
}

TEST_F(LinkTest, SendFromUnboundPortAbortsTheRun)
{
  auto sender = std::make_unique<Task>("sender", std::make_unique<BehaviorChain>());
  OutputPort& unbound = sender->addOutputPort("OUT");
  sender->getBehavior().addSegment(std::make_unique<CustomSegment>(
    "prepare", [](Task&, TaskContext& context) {
      context.put(SendSegment::MESSAGE_SEND_CONTEXT_KEY, Message(1));
      return SegmentResult::outcome(SEGMENT_SUCCESS);
    },
    std::vector<std::string>{},
    std::vector<std::string>{SendSegment::MESSAGE_SEND_CONTEXT_KEY}));
  sender->getBehavior().emplaceSegment<SendSegment>(unbound);

  sender_node_->execute(*sender);
  EXPECT_THROW(calendar_.run(), UnboundPortError);
  EXPECT_EQ(sender->getBehavior().getState(), ChainState::FAILED);
}

TEST_F(LinkTest, ChannelLinksExactlyTwoRadios)
{
  auto bystander_node = test::makeNode(calendar_, "bystander");
  CommunicationDevice& bystander = test::addRadio(calendar_, *bystander_node);
  InputPort bystander_in("IN");
  bystander.bind(bystander_in);
  bystander.listen();

  EXPECT_THROW(bystander.setChannel(channel_), ConfigurationError);
  EXPECT_EQ(bystander.getChannel(), nullptr);
  EXPECT_EQ(channel_->getDevices().size(), 2u);

  out_.send(Message(10));
  calendar_.run();
  EXPECT_EQ(in_.getQueueSize(), 1u);
  EXPECT_FALSE(bystander_in.hasMessage());
}

TEST_F(LinkTest, LeavingAChannelFreesItsEnd)
{
  auto other_node = test::makeNode(calendar_, "other");
  CommunicationDevice& other = test::addRadio(calendar_, *other_node);
  InputPort other_in("IN");
  other.bind(other_in);
  other.listen();

  receiver_radio_.setChannel(std::make_shared<DelayChannel>(100.0));
  other.setChannel(channel_);

  out_.send(Message(10));
  calendar_.run();
  EXPECT_TRUE(other_in.hasMessage());
  EXPECT_FALSE(in_.hasMessage());
}

TEST_F(LinkTest, DestroyedCounterStopsObservingThePort)
{
  {
    MessageCountLogger scoped(in_);
  }
  MessageCountLogger counter(in_);

  out_.send(Message(10));
  calendar_.run();
  EXPECT_EQ(counter.getMessageCount(), 1u);
}
