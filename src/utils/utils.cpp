#include "utils.hpp"

#include <chrono>
#include <cstdint>

namespace Utils {

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

} // namespace Utils
