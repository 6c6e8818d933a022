/**
 * @file system_interface.h
 * @brief Host measurements used by the layouts and the service
 */

#pragma once

#include <cstdint>

namespace stashd::system {

/**
 * @brief Source of host counters
 *
 * Layouts record InstructionCounter() into the header on save and into the
 * transient state on restore. MemoryUsage() is logged around saves.
 */
class SystemInterface {
 public:
  virtual ~SystemInterface() = default;

  /// Monotonic work counter for the current process
  virtual uint64_t InstructionCounter() const = 0;

  /// Resident memory in bytes
  virtual uint64_t MemoryUsage() const = 0;

  /// Wall clock, nanoseconds since the Unix epoch
  virtual uint64_t Now() const = 0;
};

/**
 * @brief Real process measurements
 *
 * The instruction counter is process CPU time in nanoseconds. Memory usage is
 * VmRSS from /proc/self/status, falling back to getrusage() peak RSS.
 */
class ProcessSystem : public SystemInterface {
 public:
  uint64_t InstructionCounter() const override;
  uint64_t MemoryUsage() const override;
  uint64_t Now() const override;
};

/**
 * @brief Settable counters for tests
 */
class FixedSystem : public SystemInterface {
 public:
  FixedSystem() = default;
  FixedSystem(uint64_t instructions, uint64_t memory, uint64_t now = 0)
      : instructions_(instructions), memory_(memory), now_(now) {}

  uint64_t InstructionCounter() const override { return instructions_; }
  uint64_t MemoryUsage() const override { return memory_; }
  uint64_t Now() const override { return now_; }

  void SetInstructionCounter(uint64_t value) { instructions_ = value; }
  void SetMemoryUsage(uint64_t value) { memory_ = value; }
  void SetNow(uint64_t value) { now_ = value; }

 private:
  uint64_t instructions_ = 0;
  uint64_t memory_ = 0;
  uint64_t now_ = 0;
};

}  // namespace stashd::system
