#ifndef COMPRESS_AND_SEND__SAMPLE_AND_COMPRESS_TASK_HPP_
#define COMPRESS_AND_SEND__SAMPLE_AND_COMPRESS_TASK_HPP_

#include "compress_and_send/compression_models.hpp"
#include "cosim_core/property_bag.hpp"
#include "cosim_core/task.hpp"
#include <cstdint>
#include <memory>

namespace compress_and_send
{

// Context keys of the sensor task
constexpr const char* SENSOR_DATA_CONTEXT_KEY = "SENSOR_DATA";
constexpr const char* COMPRESS_DATA_CONTEXT_KEY = "COMPRESS_DATA";

// Recognized task properties
constexpr const char* COMPRESSION_ALGORITHM_PROPERTY = "COMPRESSION_ALGORITHM";
constexpr const char* COMPRESSION_PERCENTAGE_PROPERTY = "COMPRESSION_PERCENTAGE";
constexpr const char* AVERAGE_PACKAGE_SIZE_PROPERTY = "AVERAGE_PACKAGE_SIZE";
constexpr const char* SDEVIATION_PACKAGE_SIZE_PROPERTY = "SDEVIATION_PACKAGE_SIZE";

constexpr const char* SAMPLE_OUTPUT_PORT = "OUTPORT";

// Parameters of the sample-and-compress task
struct SampleAndCompressConfig
{
  CompressionAlgorithm compression_algorithm;
  double compression_percentage;          // [0.0, 100.0]
  double average_package_size_bytes;
  double sdeviation_package_size_bytes;
  double sampling_interval_sec;
  uint32_t random_seed;

  SampleAndCompressConfig()
  : compression_algorithm(CompressionAlgorithm::NONE),
    compression_percentage(0.0),
    average_package_size_bytes(110.0),
    sdeviation_package_size_bytes(0.0),
    sampling_interval_sec(5.0),
    random_seed(42) {}

  // Throws cosim_core::ConfigurationError
  void validate() const;

  // Read the recognized properties; unknown property names are rejected,
  // unknown algorithm names degrade to NONE
  static SampleAndCompressConfig fromProperties(const cosim_core::PropertyBag& properties);

  void toProperties(cosim_core::PropertyBag& properties) const;
};

// Loop: wait, sense, compute sampling, compress, compute compression, send
std::unique_ptr<cosim_core::Task> buildSampleAndCompressTask(
  const SampleAndCompressConfig& config);

} // namespace compress_and_send

#endif // COMPRESS_AND_SEND__SAMPLE_AND_COMPRESS_TASK_HPP_
