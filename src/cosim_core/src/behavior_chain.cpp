#include "cosim_core/behavior_chain.hpp"
#include "cosim_core/errors.hpp"
#include "cosim_core/event_calendar.hpp"
#include "cosim_core/port.hpp"
#include "cosim_core/task.hpp"
#include <rclcpp/rclcpp.hpp>
#include <algorithm>
#include <deque>
#include <iterator>

namespace cosim_core
{

namespace
{

rclcpp::Logger chainLogger()
{
  return rclcpp::get_logger("cosim_core.behavior_chain");
}

} // namespace

const char* toString(ChainState state)
{
  switch (state) {
    case ChainState::INACTIVE: return "INACTIVE";
    case ChainState::READY: return "READY";
    case ChainState::DELAYED: return "DELAYED";
    case ChainState::BLOCKED: return "BLOCKED";
    case ChainState::TERMINATED: return "TERMINATED";
    case ChainState::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

BehaviorChain::BehaviorChain()
: looping_(false),
  task_(nullptr),
  calendar_(nullptr),
  state_(ChainState::INACTIVE),
  current_(0),
  iterations_(0),
  steps_(0)
{
}

size_t BehaviorChain::addSegment(std::unique_ptr<TaskSegment> segment)
{
  if (!segment) {
    throw ConfigurationError("Cannot add a null segment");
  }
  if (task_) {
    throw ConfigurationError("Cannot add segments to an active chain");
  }

  size_t index = segments_.size();
  segments_.push_back(std::move(segment));
  routes_.emplace_back();
  terminal_outcomes_.emplace_back();

  if (index > 0) {
    auto& previous = routes_[index - 1];
    if (previous.find(SEGMENT_SUCCESS) == previous.end() &&
        terminal_outcomes_[index - 1].count(SEGMENT_SUCCESS) == 0)
    {
      previous[SEGMENT_SUCCESS] = index;
    }
  }
  return index;
}

void BehaviorChain::checkIndex(size_t index) const
{
  if (index >= segments_.size()) {
    throw MalformedChainError("Segment index " + std::to_string(index) + " out of range");
  }
}

void BehaviorChain::route(size_t from, const std::string& outcome, size_t to)
{
  checkIndex(from);
  checkIndex(to);
  terminal_outcomes_[from].erase(outcome);
  routes_[from][outcome] = to;
}

void BehaviorChain::routeTerminal(size_t from, const std::string& outcome)
{
  checkIndex(from);
  routes_[from].erase(outcome);
  terminal_outcomes_[from].insert(outcome);
}

void BehaviorChain::declareInitialKey(const std::string& key)
{
  initial_keys_.insert(key);
}

const TaskSegment& BehaviorChain::getSegment(size_t index) const
{
  checkIndex(index);
  return *segments_[index];
}

std::optional<BehaviorChain::Route> BehaviorChain::resolve(
  size_t index, const std::string& outcome) const
{
  auto it = routes_[index].find(outcome);
  if (it != routes_[index].end()) {
    return Route{false, it->second};
  }
  if (terminal_outcomes_[index].count(outcome) > 0) {
    return Route{true, 0};
  }
  if (index + 1 == segments_.size() && outcome == SEGMENT_SUCCESS) {
    if (looping_) {
      return Route{false, 0};
    }
    return Route{true, 0};
  }
  return std::nullopt;
}

void BehaviorChain::validate() const
{
  if (segments_.empty()) {
    throw MalformedChainError("Behavior chain has no segments");
  }

  for (size_t i = 0; i < segments_.size(); ++i) {
    for (const auto& outcome : segments_[i]->getOutcomes()) {
      if (!resolve(i, outcome)) {
        throw MalformedChainError(
          "Outcome '" + outcome + "' of segment '" + segments_[i]->getName() +
          "' (#" + std::to_string(i) + ") has no route");
      }
    }
  }

  validateManifest();
}

void BehaviorChain::validateManifest() const
{
  // Must-availability of context keys over the routing graph. Entering the
  // first segment starts a new iteration with a cleared context, so edges
  // into segment 0 carry only the initial keys.
  const size_t n = segments_.size();
  std::vector<std::vector<size_t>> predecessors(n);
  std::vector<bool> reachable(n, false);

  std::set<std::string> universe = initial_keys_;
  for (const auto& segment : segments_) {
    for (const auto& key : segment->getOutputKeys()) {
      universe.insert(key);
    }
    for (const auto& key : segment->getInputKeys()) {
      universe.insert(key);
    }
  }

  std::deque<size_t> frontier{0};
  reachable[0] = true;
  while (!frontier.empty()) {
    size_t i = frontier.front();
    frontier.pop_front();
    for (const auto& outcome : segments_[i]->getOutcomes()) {
      auto next = resolve(i, outcome);
      if (next->terminal || next->target == 0) {
        continue;
      }
      predecessors[next->target].push_back(i);
      if (!reachable[next->target]) {
        reachable[next->target] = true;
        frontier.push_back(next->target);
      }
    }
  }

  std::vector<std::set<std::string>> available(n, universe);
  available[0] = initial_keys_;

  bool changed = true;
  while (changed) {
    changed = false;
    for (size_t i = 1; i < n; ++i) {
      if (!reachable[i]) {
        continue;
      }
      std::set<std::string> in;
      bool first = true;
      for (size_t p : predecessors[i]) {
        std::set<std::string> out = available[p];
        for (const auto& key : segments_[p]->getOutputKeys()) {
          out.insert(key);
        }
        if (first) {
          in = std::move(out);
          first = false;
        } else {
          std::set<std::string> both;
          std::set_intersection(in.begin(), in.end(), out.begin(), out.end(),
                                std::inserter(both, both.begin()));
          in = std::move(both);
        }
      }
      if (in != available[i]) {
        available[i] = std::move(in);
        changed = true;
      }
    }
  }

  for (size_t i = 0; i < n; ++i) {
    if (!reachable[i]) {
      continue;
    }
    for (const auto& key : segments_[i]->getInputKeys()) {
      if (available[i].count(key) == 0) {
        throw MalformedChainError(
          "Segment '" + segments_[i]->getName() + "' (#" + std::to_string(i) +
          ") reads context key '" + key + "' that is not written on every path");
      }
    }
  }
}

void BehaviorChain::activate(Task& task)
{
  if (task_) {
    throw ConfigurationError("Behavior chain of task '" + task.getName() + "' is already active");
  }
  validate();

  task_ = &task;
  calendar_ = &task.getCalendar();

  RCLCPP_INFO(chainLogger(), "Activating task '%s' (%zu segments, looping=%s)",
              task.getName().c_str(), segments_.size(), looping_ ? "true" : "false");

  enterSegment(0);
  scheduleStep();
}

void BehaviorChain::enterSegment(size_t index)
{
  current_ = index;
  if (index == 0) {
    task_->getContext().clear();
    iterations_++;
  }
}

void BehaviorChain::scheduleStep()
{
  // Every step goes through the calendar, so zero-delay transitions of
  // different tasks interleave in FIFO order
  state_ = ChainState::READY;
  calendar_->scheduleAt(calendar_->now(), [this]() { step(); });
}

void BehaviorChain::step()
{
  TaskSegment& segment = *segments_[current_];
  try {
    SegmentResult result = segment.execute(*task_, task_->getContext());
    steps_++;
    handleResult(result);
  } catch (const DataError& e) {
    fail(e);
  } catch (const ConfigurationError& e) {
    fail(e);
    throw;
  }
}

void BehaviorChain::handleResult(const SegmentResult& result)
{
  switch (result.getKind()) {
    case SegmentResult::Kind::OUTCOME:
      advance(result.getOutcome());
      break;

    case SegmentResult::Kind::DELAY: {
      state_ = ChainState::DELAYED;
      std::string outcome = result.getOutcome();
      calendar_->scheduleAt(calendar_->now() + result.getDelay(), [this, outcome]() {
        finishDelay(outcome);
      });
      break;
    }

    case SegmentResult::Kind::BLOCK:
      state_ = ChainState::BLOCKED;
      result.getPort()->setWaiter([this]() { scheduleStep(); });
      break;
  }
}

void BehaviorChain::finishDelay(const std::string& outcome)
{
  try {
    segments_[current_]->complete(*task_, task_->getContext());
    advance(outcome);
  } catch (const DataError& e) {
    fail(e);
  } catch (const ConfigurationError& e) {
    fail(e);
    throw;
  }
}

void BehaviorChain::advance(const std::string& outcome)
{
  if (outcome_observer_) {
    outcome_observer_(current_, outcome);
  }

  auto next = resolve(current_, outcome);
  if (!next) {
    throw MalformedChainError(
      "Segment '" + segments_[current_]->getName() + "' produced unrouted outcome '" +
      outcome + "'");
  }

  if (next->terminal) {
    state_ = ChainState::TERMINATED;
    RCLCPP_INFO(chainLogger(), "Task '%s' terminated after %lu iteration(s)",
                task_->getName().c_str(), static_cast<unsigned long>(iterations_));
    return;
  }

  enterSegment(next->target);
  scheduleStep();
}

void BehaviorChain::fail(const std::exception& e)
{
  state_ = ChainState::FAILED;
  RCLCPP_ERROR(chainLogger(), "Task '%s' failed in segment '%s' at t=%.6f: %s",
               task_->getName().c_str(), segments_[current_]->getName().c_str(),
               calendar_->now(), e.what());
}

} // namespace cosim_core
