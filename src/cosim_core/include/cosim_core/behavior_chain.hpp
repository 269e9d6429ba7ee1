#ifndef COSIM_CORE__BEHAVIOR_CHAIN_HPP_
#define COSIM_CORE__BEHAVIOR_CHAIN_HPP_

#include "cosim_core/task_segment.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace cosim_core
{

class EventCalendar;
class Task;

enum class ChainState
{
  INACTIVE,    // never activated
  READY,       // next step scheduled on the calendar
  DELAYED,     // waiting for a timed completion
  BLOCKED,     // waiting for a message delivery
  TERMINATED,  // reached a terminal outcome
  FAILED       // aborted by a data error
};

const char* toString(ChainState state);

// Segment graph plus the driver that walks it on the event calendar.
// Adding a segment routes the previous segment's success outcome to it;
// other outcomes are routed explicitly.
class BehaviorChain
{
public:
  using OutcomeObserver = std::function<void(size_t segment_index, const std::string& outcome)>;

  BehaviorChain();
  ~BehaviorChain() = default;

  BehaviorChain(const BehaviorChain&) = delete;
  BehaviorChain& operator=(const BehaviorChain&) = delete;

  // Returns the index of the added segment
  size_t addSegment(std::unique_ptr<TaskSegment> segment);

  template<typename T, typename... Args>
  T& emplaceSegment(Args&&... args)
  {
    auto segment = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *segment;
    addSegment(std::move(segment));
    return ref;
  }

  // The last segment's success outcome returns to the first segment
  void setLooping(bool looping) { looping_ = looping; }
  bool isLooping() const { return looping_; }

  void route(size_t from, const std::string& outcome, size_t to);
  void routeTerminal(size_t from, const std::string& outcome);

  // Context keys available when an iteration starts
  void declareInitialKey(const std::string& key);

  // Throws MalformedChainError on unrouted outcomes or unsatisfied context reads
  void validate() const;

  // Validate, then schedule the first segment of the task's first iteration
  void activate(Task& task);

  ChainState getState() const { return state_; }
  size_t getCurrentIndex() const { return current_; }
  uint64_t getIterations() const { return iterations_; }
  uint64_t getSteps() const { return steps_; }

  size_t size() const { return segments_.size(); }
  const TaskSegment& getSegment(size_t index) const;

  void setOutcomeObserver(OutcomeObserver observer) { outcome_observer_ = std::move(observer); }

private:
  struct Route
  {
    bool terminal;
    size_t target;
  };

  std::optional<Route> resolve(size_t index, const std::string& outcome) const;

  void checkIndex(size_t index) const;
  void validateManifest() const;

  void scheduleStep();
  void step();
  void handleResult(const SegmentResult& result);
  void finishDelay(const std::string& outcome);
  void advance(const std::string& outcome);
  void enterSegment(size_t index);
  void fail(const std::exception& e);

  std::vector<std::unique_ptr<TaskSegment>> segments_;
  std::vector<std::map<std::string, size_t>> routes_;
  std::vector<std::set<std::string>> terminal_outcomes_;
  std::set<std::string> initial_keys_;
  bool looping_;

  Task* task_;
  EventCalendar* calendar_;
  ChainState state_;
  size_t current_;
  uint64_t iterations_;
  uint64_t steps_;
  OutcomeObserver outcome_observer_;
};

} // namespace cosim_core

#endif // COSIM_CORE__BEHAVIOR_CHAIN_HPP_
