#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace tfc {

/**
 * @brief Random lowercase hex string of the given length.
 */
inline std::string random_hex(size_t length) {
  static std::mutex mutex;
  static std::mt19937_64 engine{std::random_device{}()};
  static constexpr char DIGITS[] = "0123456789abcdef";

  std::string out;
  out.reserve(length);
  std::lock_guard<std::mutex> lock(mutex);
  std::uniform_int_distribution<int> dist(0, 15);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(DIGITS[dist(engine)]);
  }
  return out;
}

inline std::string generate_worker_id() { return random_hex(8); }

// 8-4-4-4-12 layout, version nibble set to 4
inline std::string generate_instance_id() {
  std::string hex = random_hex(32);
  hex[12] = '4';
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace tfc
