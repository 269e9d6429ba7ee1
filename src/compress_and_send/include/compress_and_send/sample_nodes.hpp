#ifndef COMPRESS_AND_SEND__SAMPLE_NODES_HPP_
#define COMPRESS_AND_SEND__SAMPLE_NODES_HPP_

#include "cosim_core/event_calendar.hpp"
#include "cosim_core/node.hpp"
#include <memory>

namespace compress_and_send
{

constexpr const char* COMM_DEVICE_NAME = "COMM_DEVICE";

// Small battery-powered microcontroller with a radio
std::unique_ptr<cosim_core::Node> buildSampleAndCompressNode(cosim_core::EventCalendar& calendar);

// Receiving end of the link, same radio
std::unique_ptr<cosim_core::Node> buildSinkNode(cosim_core::EventCalendar& calendar);

} // namespace compress_and_send

#endif // COMPRESS_AND_SEND__SAMPLE_NODES_HPP_
