#include "cosim_core/event_calendar.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace cosim_core
{

EventCalendar::EventCalendar()
: now_sec_(0.0), next_sequence_(0), processed_events_(0)
{
}

EventHandle EventCalendar::scheduleAt(double time_sec, std::function<void()> callback)
{
  if (std::isnan(time_sec) || time_sec < now_sec_) {
    throw std::invalid_argument(
      "Cannot schedule event at " + std::to_string(time_sec) +
      " (now=" + std::to_string(now_sec_) + ")");
  }
  if (!callback) {
    throw std::invalid_argument("Cannot schedule an empty callback");
  }

  EventHandle handle = next_sequence_++;
  queue_.push(ScheduledEvent{time_sec, handle, std::move(callback)});
  pending_.insert(handle);
  return handle;
}

EventHandle EventCalendar::scheduleAfter(double delay_sec, std::function<void()> callback)
{
  if (std::isnan(delay_sec) || delay_sec < 0.0) {
    throw std::invalid_argument("Negative event delay: " + std::to_string(delay_sec));
  }
  return scheduleAt(now_sec_ + delay_sec, std::move(callback));
}

bool EventCalendar::cancel(EventHandle handle)
{
  if (pending_.erase(handle) == 0) {
    return false;
  }
  cancelled_.insert(handle);
  return true;
}

void EventCalendar::discardCancelled()
{
  while (!queue_.empty() && cancelled_.count(queue_.top().sequence) > 0) {
    cancelled_.erase(queue_.top().sequence);
    queue_.pop();
  }
}

bool EventCalendar::step()
{
  discardCancelled();
  if (queue_.empty()) {
    return false;
  }

  ScheduledEvent event = queue_.top();
  queue_.pop();
  pending_.erase(event.sequence);

  now_sec_ = event.time_sec;
  processed_events_++;
  event.callback();
  return true;
}

void EventCalendar::run(double stop_time_sec)
{
  while (true) {
    discardCancelled();
    if (queue_.empty() || queue_.top().time_sec > stop_time_sec) {
      break;
    }
    step();
  }

  if (std::isfinite(stop_time_sec) && stop_time_sec > now_sec_) {
    now_sec_ = stop_time_sec;
  }
}

} // namespace cosim_core
