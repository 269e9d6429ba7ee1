#ifndef COSIM_CORE__DEVICE_HPP_
#define COSIM_CORE__DEVICE_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cosim_core
{

// Mode name -> power draw in watts
using ModeTable = std::map<std::string, double>;

// Physical component holding exactly one operating mode at any time
class Device
{
public:
  // Called after a mode switch with the mode that was left
  using ModeObserver = std::function<void(const Device& device, const std::string& previous_mode)>;
  using ObserverId = uint64_t;

  Device(const std::string& name, const ModeTable& modes, const std::string& initial_mode);
  virtual ~Device() = default;

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  const std::string& getName() const { return name_; }
  const std::string& getMode() const { return mode_; }
  const ModeTable& getModes() const { return modes_; }

  bool hasMode(const std::string& mode) const;

  // Immediate switch, no transition cost. Throws UnknownModeError.
  void setMode(const std::string& mode);

  // Power draw of the current mode
  double getPower() const;

  // Throws UnknownModeError
  double getModePower(const std::string& mode) const;

  // Returns the id to pass to removeModeObserver
  ObserverId addModeObserver(ModeObserver observer);
  void removeModeObserver(ObserverId id);

protected:
  void requireMode(const std::string& mode) const;

private:
  std::string name_;
  ModeTable modes_;
  std::string mode_;
  std::vector<std::pair<ObserverId, ModeObserver>> observers_;
  ObserverId next_observer_id_;
};

class Processor : public Device
{
public:
  static constexpr const char* IDLE_MODE = "IDLE";
  static constexpr const char* BUSY_MODE = "BUSY";

  Processor(
    const std::string& name,
    double iops_per_sec,
    double flops_per_sec,
    const ModeTable& modes,
    const std::string& idle_mode = IDLE_MODE,
    const std::string& busy_mode = BUSY_MODE);

  double getIopsPerSec() const { return iops_per_sec_; }
  double getFlopsPerSec() const { return flops_per_sec_; }

  // Simulated time needed for the given operation counts
  double computeDuration(double flops, double iops) const;

  // Nested busy periods keep the processor busy until the last one ends
  void beginWork();
  void endWork();

  int getActiveWork() const { return active_work_; }

private:
  double iops_per_sec_;
  double flops_per_sec_;
  std::string idle_mode_;
  std::string busy_mode_;
  int active_work_;
};

// Memory module; draws nothing unless given a mode table
class Memory : public Device
{
public:
  explicit Memory(const std::string& name, uint64_t capacity_bytes = 0);
  Memory(const std::string& name, uint64_t capacity_bytes,
         const ModeTable& modes, const std::string& initial_mode);

  uint64_t getCapacity() const { return capacity_bytes_; }

private:
  uint64_t capacity_bytes_;
};

// Finite charge source of a node. Charge never increases.
class Battery
{
public:
  using DepletionCallback = std::function<void(const Battery&)>;

  Battery(const std::string& name, double potential_v, double charge_c);

  const std::string& getName() const { return name_; }
  double getPotential() const { return potential_v_; }
  double getCharge() const { return charge_c_; }
  double getInitialCharge() const { return initial_charge_c_; }

  // Remaining fraction of the initial charge (0.0 - 1.0)
  double getStateOfCharge() const;

  bool isDepleted() const { return depleted_; }

  // Remove energy_j / potential coulombs, clamped at zero.
  // Returns the charge actually removed.
  double drainEnergy(double energy_j);

  void setDepletionCallback(DepletionCallback callback);

private:
  std::string name_;
  double potential_v_;
  double charge_c_;
  double initial_charge_c_;
  bool depleted_;
  DepletionCallback depletion_callback_;
};

} // namespace cosim_core

#endif // COSIM_CORE__DEVICE_HPP_
