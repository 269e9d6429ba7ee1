#include "compress_and_send/sample_and_compress_task.hpp"
#include "cosim_core/errors.hpp"
#include "cosim_core/segments.hpp"
#include <algorithm>
#include <random>
#include <set>

namespace compress_and_send
{

using cosim_core::CalculateSegment;
using cosim_core::CopyDataSegment;
using cosim_core::CustomSegment;
using cosim_core::DelaySegment;
using cosim_core::Message;
using cosim_core::SegmentResult;
using cosim_core::SendSegment;
using cosim_core::Task;
using cosim_core::TaskContext;

namespace
{

std::unique_ptr<CustomSegment> createSenseSegment(const SampleAndCompressConfig& config)
{
  auto generator = std::make_shared<std::mt19937>(config.random_seed);
  double mu = config.average_package_size_bytes;
  double sigma = config.sdeviation_package_size_bytes;

  return std::make_unique<CustomSegment>(
    "sense",
    [generator, mu, sigma](Task&, TaskContext& context) {
      std::normal_distribution<double> gaussian(0.0, 1.0);
      double data_size = std::max(0.0, mu + sigma * gaussian(*generator));

      context.put(CalculateSegment::FLOPS_CONTEXT_KEY, static_cast<int64_t>(data_size));
      context.put(CalculateSegment::IOPS_CONTEXT_KEY, static_cast<int64_t>(0));
      context.put(SENSOR_DATA_CONTEXT_KEY, data_size);
      return SegmentResult::outcome(cosim_core::SEGMENT_SUCCESS);
    },
    std::vector<std::string>{},
    std::vector<std::string>{
      CalculateSegment::FLOPS_CONTEXT_KEY,
      CalculateSegment::IOPS_CONTEXT_KEY,
      SENSOR_DATA_CONTEXT_KEY});
}

std::unique_ptr<CustomSegment> createCompressSegment(const SampleAndCompressConfig& config)
{
  CompressionAlgorithm algorithm = config.compression_algorithm;
  double percentage = config.compression_percentage;

  return std::make_unique<CustomSegment>(
    "compress",
    [algorithm, percentage](Task&, TaskContext& context) {
      double data_size = context.getAs<double>(COMPRESS_DATA_CONTEXT_KEY);
      CompressionCost cost = estimateCompression(algorithm, percentage, data_size);

      context.put(CalculateSegment::FLOPS_CONTEXT_KEY, cost.flops);
      context.put(CalculateSegment::IOPS_CONTEXT_KEY, static_cast<int64_t>(0));

      Message message = Message::createFrom(
        static_cast<uint64_t>(std::max<int64_t>(0, cost.packet_size_bytes)),
        {{"ALGORITHM", std::string(toString(algorithm))},
         {"ORIGINAL_SIZE", data_size}});
      context.put(COMPRESS_DATA_CONTEXT_KEY, message);
      return SegmentResult::outcome(cosim_core::SEGMENT_SUCCESS);
    },
    std::vector<std::string>{COMPRESS_DATA_CONTEXT_KEY},
    std::vector<std::string>{
      CalculateSegment::FLOPS_CONTEXT_KEY,
      CalculateSegment::IOPS_CONTEXT_KEY,
      COMPRESS_DATA_CONTEXT_KEY});
}

} // namespace

void SampleAndCompressConfig::validate() const
{
  if (compression_percentage < 0.0 || compression_percentage > 100.0) {
    throw cosim_core::ConfigurationError(
      "Compression percentage must lie in [0, 100], got " +
      std::to_string(compression_percentage));
  }
  if (average_package_size_bytes < 0.0) {
    throw cosim_core::ConfigurationError("Average package size must not be negative");
  }
  if (sdeviation_package_size_bytes < 0.0) {
    throw cosim_core::ConfigurationError("Package size deviation must not be negative");
  }
  if (sampling_interval_sec < 0.0) {
    throw cosim_core::ConfigurationError("Sampling interval must not be negative");
  }
}

SampleAndCompressConfig SampleAndCompressConfig::fromProperties(
  const cosim_core::PropertyBag& properties)
{
  static const std::set<std::string> recognized{
    COMPRESSION_ALGORITHM_PROPERTY,
    COMPRESSION_PERCENTAGE_PROPERTY,
    AVERAGE_PACKAGE_SIZE_PROPERTY,
    SDEVIATION_PACKAGE_SIZE_PROPERTY};

  for (const auto& name : properties.names()) {
    if (recognized.count(name) == 0) {
      throw cosim_core::ConfigurationError("Unrecognized sample-and-compress property: " + name);
    }
  }

  SampleAndCompressConfig config;
  if (properties.has(COMPRESSION_ALGORITHM_PROPERTY)) {
    config.compression_algorithm = parseCompressionAlgorithm(
      properties.getAs<std::string>(COMPRESSION_ALGORITHM_PROPERTY));
  }
  if (properties.has(COMPRESSION_PERCENTAGE_PROPERTY)) {
    config.compression_percentage = properties.getNumber(COMPRESSION_PERCENTAGE_PROPERTY);
  }
  if (properties.has(AVERAGE_PACKAGE_SIZE_PROPERTY)) {
    config.average_package_size_bytes = properties.getNumber(AVERAGE_PACKAGE_SIZE_PROPERTY);
  }
  if (properties.has(SDEVIATION_PACKAGE_SIZE_PROPERTY)) {
    config.sdeviation_package_size_bytes = properties.getNumber(SDEVIATION_PACKAGE_SIZE_PROPERTY);
  }

  config.validate();
  return config;
}

void SampleAndCompressConfig::toProperties(cosim_core::PropertyBag& properties) const
{
  properties.set(COMPRESSION_ALGORITHM_PROPERTY, std::string(toString(compression_algorithm)));
  properties.set(COMPRESSION_PERCENTAGE_PROPERTY, compression_percentage);
  properties.set(AVERAGE_PACKAGE_SIZE_PROPERTY, average_package_size_bytes);
  properties.set(SDEVIATION_PACKAGE_SIZE_PROPERTY, sdeviation_package_size_bytes);
}

std::unique_ptr<Task> buildSampleAndCompressTask(const SampleAndCompressConfig& config)
{
  config.validate();

  auto behavior = std::make_unique<cosim_core::BehaviorChain>();
  auto task = std::make_unique<Task>("SampleAndCompressTask", std::move(behavior));
  config.toProperties(task->getProperties());

  cosim_core::OutputPort& output_port = task->addOutputPort(SAMPLE_OUTPUT_PORT);

  cosim_core::BehaviorChain& chain = task->getBehavior();
  chain.setLooping(true);
  chain.emplaceSegment<DelaySegment>(config.sampling_interval_sec, "wait");
  chain.addSegment(createSenseSegment(config));
  chain.emplaceSegment<CalculateSegment>("calculate sampling");
  chain.emplaceSegment<CopyDataSegment>(SENSOR_DATA_CONTEXT_KEY, COMPRESS_DATA_CONTEXT_KEY);
  chain.addSegment(createCompressSegment(config));
  chain.emplaceSegment<CalculateSegment>("calculate compression");
  chain.emplaceSegment<CopyDataSegment>(COMPRESS_DATA_CONTEXT_KEY,
                                        SendSegment::MESSAGE_SEND_CONTEXT_KEY);
  chain.emplaceSegment<SendSegment>(output_port, false);

  return task;
}

} // namespace compress_and_send
