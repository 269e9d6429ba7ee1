#include "compress_and_send/compression_models.hpp"
#include <rclcpp/rclcpp.hpp>
#include <cmath>

namespace compress_and_send
{

namespace
{
constexpr double PI = 3.14159265358979323846;
} // namespace

CompressionAlgorithm parseCompressionAlgorithm(const std::string& name)
{
  if (name == "ZIP") {
    return CompressionAlgorithm::ZIP;
  }
  if (name == "RAR") {
    return CompressionAlgorithm::RAR;
  }
  if (name != "NONE") {
    RCLCPP_WARN(rclcpp::get_logger("compress_and_send.compression"),
                "Unknown compression method: '%s': no compression applied.", name.c_str());
  }
  return CompressionAlgorithm::NONE;
}

const char* toString(CompressionAlgorithm algorithm)
{
  switch (algorithm) {
    case CompressionAlgorithm::NONE: return "NONE";
    case CompressionAlgorithm::ZIP: return "ZIP";
    case CompressionAlgorithm::RAR: return "RAR";
  }
  return "NONE";
}

double zipSize(double percentage)
{
  return 0.978 + (1.01 * std::cos((PI * (percentage + 120.0)) / 240.0));
}

double zipFlOps(double percentage)
{
  const double scale = 1.0e3;
  const double bumpy_part = std::cos(std::pow(percentage / 40.0, 1.6));
  return scale * ((1.0 / std::pow(101.0 - percentage, 0.45)) + bumpy_part);
}

double rarSize(double percentage)
{
  return (3.0 / ((percentage + 61.0) / 32.0)) - 0.596;
}

double rarFlOps(double percentage)
{
  const double scale = 1.0e3;
  const double bumpy_part = std::sin(std::pow(percentage / 45.0, 1.3));
  return scale * ((1.0 / std::pow(102.0 - percentage, 0.39)) + bumpy_part);
}

CompressionCost estimateCompression(
  CompressionAlgorithm algorithm,
  double percentage,
  double data_size_bytes)
{
  // Uncompressed data leaves as is, for one bookkeeping operation
  CompressionCost cost{static_cast<int64_t>(data_size_bytes), 1};

  switch (algorithm) {
    case CompressionAlgorithm::ZIP:
      cost.packet_size_bytes = static_cast<int64_t>(zipSize(percentage) * data_size_bytes);
      cost.flops = static_cast<int64_t>(zipFlOps(percentage) * data_size_bytes);
      break;
    case CompressionAlgorithm::RAR:
      cost.packet_size_bytes = static_cast<int64_t>(rarSize(percentage) * data_size_bytes);
      cost.flops = static_cast<int64_t>(rarFlOps(percentage) * data_size_bytes);
      break;
    case CompressionAlgorithm::NONE:
      break;
  }
  return cost;
}

} // namespace compress_and_send
