#include "cosim_core/loggers.hpp"
#include "cosim_core/port.hpp"

namespace cosim_core
{

MessageCountLogger::MessageCountLogger(InputPort& port)
: port_(port), observer_(0), message_count_(0), total_bytes_(0)
{
  observer_ = port_.addDeliveryObserver([this](const InputPort&, const Message& message) {
    message_count_++;
    total_bytes_ += message.getSize();
  });
}

MessageCountLogger::~MessageCountLogger()
{
  port_.removeDeliveryObserver(observer_);
}

} // namespace cosim_core
