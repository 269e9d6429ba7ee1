#include <gtest/gtest.h>
#include "compress_and_send/compression_models.hpp"
#include <rcutils/logging.h>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

using namespace compress_and_send;

namespace
{

std::vector<std::string>& capturedWarnings()
{
  static std::vector<std::string> warnings;
  return warnings;
}

void captureWarnings(
  const rcutils_log_location_t* /*location*/,
  int severity,
  const char* name,
  rcutils_time_point_value_t /*timestamp*/,
  const char* format,
  va_list* args)
{
  if (severity < RCUTILS_LOG_SEVERITY_WARN) {
    return;
  }
  char buffer[1024];
  va_list copy;
  va_copy(copy, *args);
  std::vsnprintf(buffer, sizeof(buffer), format, copy);
  va_end(copy);
  capturedWarnings().push_back(std::string(name) + ": " + buffer);
}

// Routes rclcpp log output into capturedWarnings() for the test's duration
class CompressionDiagnosticsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ASSERT_EQ(rcutils_logging_initialize(), RCUTILS_RET_OK);
    previous_handler_ = rcutils_logging_get_output_handler();
    rcutils_logging_set_output_handler(captureWarnings);
    capturedWarnings().clear();
  }

  void TearDown() override
  {
    rcutils_logging_set_output_handler(previous_handler_);
  }

  rcutils_logging_output_handler_t previous_handler_;
};

} // namespace

TEST(CompressionModelsTest, ZipCurvesAtTwentyPercent)
{
  EXPECT_NEAR(zipSize(20.0), 0.7165927644464541, 1e-12);
  EXPECT_NEAR(zipFlOps(20.0), 1084.4967497363698, 1e-9);
  EXPECT_NEAR(zipFlOps(0.0), 1125.3300987325238, 1e-9);
}

TEST(CompressionModelsTest, RarCurvesAtTwentyPercent)
{
  EXPECT_NEAR(rarSize(20.0), 0.5891851851851851, 1e-12);
  EXPECT_NEAR(rarFlOps(20.0), 520.7714926271865, 1e-9);
}

TEST(CompressionModelsTest, HigherPercentageShrinksZipOutput)
{
  EXPECT_LT(zipSize(60.0), zipSize(20.0));
  EXPECT_LT(rarSize(60.0), rarSize(20.0));
}

TEST(CompressionModelsTest, EstimateTruncatesToWholeBytesAndOperations)
{
  CompressionCost zip = estimateCompression(CompressionAlgorithm::ZIP, 20.0, 110.0);
  EXPECT_EQ(zip.packet_size_bytes, 78);
  EXPECT_EQ(zip.flops, 119294);

  CompressionCost rar = estimateCompression(CompressionAlgorithm::RAR, 20.0, 100.0);
  EXPECT_EQ(rar.packet_size_bytes, 58);
  EXPECT_EQ(rar.flops, 52077);
}

TEST(CompressionModelsTest, NoCompressionKeepsSize)
{
  CompressionCost none = estimateCompression(CompressionAlgorithm::NONE, 50.0, 110.0);
  EXPECT_EQ(none.packet_size_bytes, 110);
  EXPECT_EQ(none.flops, 1);
}

TEST(CompressionModelsTest, ParseAlgorithmNames)
{
  EXPECT_EQ(parseCompressionAlgorithm("ZIP"), CompressionAlgorithm::ZIP);
  EXPECT_EQ(parseCompressionAlgorithm("RAR"), CompressionAlgorithm::RAR);
  EXPECT_EQ(parseCompressionAlgorithm("NONE"), CompressionAlgorithm::NONE);
  EXPECT_EQ(parseCompressionAlgorithm("GZIP"), CompressionAlgorithm::NONE);
  EXPECT_EQ(parseCompressionAlgorithm("zip"), CompressionAlgorithm::NONE);
  EXPECT_STREQ(toString(CompressionAlgorithm::RAR), "RAR");
}

TEST_F(CompressionDiagnosticsTest, UnknownAlgorithmIsReported)
{
  EXPECT_EQ(parseCompressionAlgorithm("GZIP"), CompressionAlgorithm::NONE);

  ASSERT_EQ(capturedWarnings().size(), 1u);
  const std::string& warning = capturedWarnings().front();
  EXPECT_NE(warning.find("compress_and_send.compression"), std::string::npos);
  EXPECT_NE(warning.find("Unknown compression method: 'GZIP'"), std::string::npos);
  EXPECT_NE(warning.find("no compression applied"), std::string::npos);
}

TEST_F(CompressionDiagnosticsTest, KnownAlgorithmsAreSilent)
{
  parseCompressionAlgorithm("ZIP");
  parseCompressionAlgorithm("RAR");
  parseCompressionAlgorithm("NONE");
  EXPECT_TRUE(capturedWarnings().empty());
}
