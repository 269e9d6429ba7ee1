#ifndef COSIM_CORE__EVENT_CALENDAR_HPP_
#define COSIM_CORE__EVENT_CALENDAR_HPP_

#include <cstdint>
#include <functional>
#include <limits>
#include <queue>
#include <unordered_set>
#include <vector>

namespace cosim_core
{

using EventHandle = uint64_t;

struct ScheduledEvent
{
  double time_sec;
  uint64_t sequence;
  std::function<void()> callback;
};

// Comparator for priority queue (earliest time first, then enqueue order)
struct EventComparator
{
  bool operator()(const ScheduledEvent& a, const ScheduledEvent& b) const
  {
    if (a.time_sec != b.time_sec) {
      return a.time_sec > b.time_sec;
    }
    return a.sequence > b.sequence;
  }
};

// Single-threaded discrete-event calendar owning simulated time.
// One instance per simulation run; components receive it by reference.
class EventCalendar
{
public:
  EventCalendar();
  ~EventCalendar() = default;

  EventCalendar(const EventCalendar&) = delete;
  EventCalendar& operator=(const EventCalendar&) = delete;

  // Current simulated time in seconds
  double now() const { return now_sec_; }

  // Schedule callback at an absolute instant (must not lie in the past)
  EventHandle scheduleAt(double time_sec, std::function<void()> callback);

  // Schedule callback at now() + delay_sec
  EventHandle scheduleAfter(double delay_sec, std::function<void()> callback);

  // Revoke a pending event. Returns false if it already fired or was cancelled.
  bool cancel(EventHandle handle);

  // Fire the next pending event. Returns false when the calendar is empty.
  bool step();

  // Fire events up to and including stop_time_sec, then advance now() to it
  void run(double stop_time_sec = std::numeric_limits<double>::infinity());

  size_t getPendingEvents() const { return pending_.size(); }
  uint64_t getProcessedEvents() const { return processed_events_; }

private:
  // Drop cancelled events sitting at the head of the queue
  void discardCancelled();

  std::priority_queue<ScheduledEvent,
                      std::vector<ScheduledEvent>,
                      EventComparator> queue_;

  std::unordered_set<EventHandle> pending_;
  std::unordered_set<EventHandle> cancelled_;

  double now_sec_;
  uint64_t next_sequence_;
  uint64_t processed_events_;
};

} // namespace cosim_core

#endif // COSIM_CORE__EVENT_CALENDAR_HPP_
