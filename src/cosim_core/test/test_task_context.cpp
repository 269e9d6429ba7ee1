#include <gtest/gtest.h>
#include "cosim_core/errors.hpp"
#include "cosim_core/task_context.hpp"
#include <string>

using cosim_core::ContextValue;
using cosim_core::DataError;
using cosim_core::Message;
using cosim_core::MissingKeyError;
using cosim_core::TaskContext;

TEST(TaskContextTest, MissingKeyThrows)
{
  TaskContext context;
  try {
    context.get("SENSOR_DATA");
    FAIL() << "expected MissingKeyError";
  } catch (const MissingKeyError& e) {
    EXPECT_EQ(e.getKey(), "SENSOR_DATA");
  }
}

TEST(TaskContextTest, DefaultReturnedForMissingKey)
{
  TaskContext context;
  ContextValue value = context.getOr("FLOPS", static_cast<int64_t>(7));
  EXPECT_EQ(std::get<int64_t>(value), 7);
}

TEST(TaskContextTest, PutOverwrites)
{
  TaskContext context;
  context.put("KEY", 1.5);
  context.put("KEY", std::string("text"));

  EXPECT_EQ(context.size(), 1u);
  EXPECT_EQ(context.getAs<std::string>("KEY"), "text");
}

TEST(TaskContextTest, TypedAccessRejectsOtherTypes)
{
  TaskContext context;
  context.put("MSG", Message(64));

  EXPECT_EQ(context.getAs<Message>("MSG").getSize(), 64u);
  EXPECT_THROW(context.getAs<double>("MSG"), DataError);
  EXPECT_THROW(context.getNumber("MSG"), DataError);
}

TEST(TaskContextTest, NumbersAcceptIntegerAndReal)
{
  TaskContext context;
  context.put("IOPS", static_cast<int64_t>(12));
  context.put("FLOPS", 2.5);

  EXPECT_DOUBLE_EQ(context.getNumber("IOPS"), 12.0);
  EXPECT_DOUBLE_EQ(context.getNumber("FLOPS"), 2.5);
}

TEST(TaskContextTest, ClearAndErase)
{
  TaskContext context;
  context.put("A", 1.0);
  context.put("B", 2.0);

  EXPECT_TRUE(context.erase("A"));
  EXPECT_FALSE(context.erase("A"));
  EXPECT_FALSE(context.contains("A"));

  context.clear();
  EXPECT_EQ(context.size(), 0u);
}

TEST(MessageTest, SizeFieldMirrorsSize)
{
  Message message(128, {{"SEQ", static_cast<int64_t>(4)}});

  EXPECT_EQ(std::get<int64_t>(message.getField(Message::SIZE)), 128);
  EXPECT_EQ(std::get<int64_t>(message.getField("SEQ")), 4);
  EXPECT_THROW(message.getField("MISSING"), DataError);
}
