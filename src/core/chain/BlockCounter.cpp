#include "BlockCounter.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>

namespace objreg {

void ManualBlockCounter::set(std::int64_t height) {
  std::int64_t seen = height_.load();
  do {
    if (height < seen) {
      throw std::invalid_argument("block counter cannot move backwards to " + std::to_string(height));
    }
  } while (!height_.compare_exchange_weak(seen, height));
}

void ManualBlockCounter::advance(std::int64_t blocks) {
  if (blocks < 0) throw std::invalid_argument("block counter cannot move backwards");
  std::int64_t seen = height_.load();
  do {
    if (blocks > std::numeric_limits<std::int64_t>::max() - seen) {
      throw std::overflow_error("block counter would overflow advancing by " + std::to_string(blocks));
    }
  } while (!height_.compare_exchange_weak(seen, seen + blocks));
}

WallClockBlockCounter::WallClockBlockCounter(std::int64_t genesisUnix, std::int64_t intervalSeconds)
  : genesisUnix_(genesisUnix), intervalSeconds_(intervalSeconds), highWater_(0) {
  if (intervalSeconds_ <= 0) {
    throw std::invalid_argument("block interval must be positive, got " + std::to_string(intervalSeconds));
  }
}

std::int64_t WallClockBlockCounter::current() const {
  using namespace std::chrono;
  const std::int64_t now = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
  const std::int64_t elapsed = now > genesisUnix_ ? now - genesisUnix_ : 0;
  const std::int64_t height = elapsed / intervalSeconds_;

  std::int64_t seen = highWater_.load();
  while (height > seen && !highWater_.compare_exchange_weak(seen, height)) {}
  return height > seen ? height : seen;
}

} // namespace objreg
