#pragma once
#include <atomic>
#include <cstdint>

namespace objreg {

// Source of the ambient, never-decreasing counter deadlines are measured on.
class BlockCounter {
public:
  virtual ~BlockCounter() = default;
  virtual std::int64_t current() const = 0;
};

// Counter driven explicitly by the caller. Used by tests and tooling.
class ManualBlockCounter : public BlockCounter {
public:
  explicit ManualBlockCounter(std::int64_t start = 0) : height_(start) {}

  std::int64_t current() const override { return height_.load(); }

  // Rejects values below the current height, and advances past INT64_MAX.
  void set(std::int64_t height);
  void advance(std::int64_t blocks = 1);

private:
  std::atomic<std::int64_t> height_;
};

// Height = whole block intervals elapsed since genesisUnix on the system clock.
// The last value handed out is remembered so a clock step backwards never
// makes the counter go down.
class WallClockBlockCounter : public BlockCounter {
public:
  WallClockBlockCounter(std::int64_t genesisUnix, std::int64_t intervalSeconds);

  std::int64_t current() const override;

private:
  std::int64_t genesisUnix_;
  std::int64_t intervalSeconds_;
  mutable std::atomic<std::int64_t> highWater_;
};

} // namespace objreg
