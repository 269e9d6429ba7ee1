#ifndef COMPRESS_AND_SEND__COMPRESSION_MODELS_HPP_
#define COMPRESS_AND_SEND__COMPRESSION_MODELS_HPP_

#include <cstdint>
#include <string>

namespace compress_and_send
{

enum class CompressionAlgorithm
{
  NONE,
  ZIP,
  RAR
};

// Unknown names fall back to NONE with a warning
CompressionAlgorithm parseCompressionAlgorithm(const std::string& name);

const char* toString(CompressionAlgorithm algorithm);

// Resulting size ratio of "ZIP" for a target compression percentage
double zipSize(double percentage);

// Floating point operations per input byte spent by "ZIP"
double zipFlOps(double percentage);

// Resulting size ratio of "RAR" for a target compression percentage
double rarSize(double percentage);

// Floating point operations per input byte spent by "RAR"
double rarFlOps(double percentage);

// Outcome of compressing one sample
struct CompressionCost
{
  int64_t packet_size_bytes;
  int64_t flops;
};

CompressionCost estimateCompression(
  CompressionAlgorithm algorithm,
  double percentage,
  double data_size_bytes);

} // namespace compress_and_send

#endif // COMPRESS_AND_SEND__COMPRESSION_MODELS_HPP_
