#include <chrono>
#include <random>
#include <thread>

#include <flotilla/util/random.hpp>

namespace flot::util {
static inline std::mt19937&
random_mt() {
  // Seed from time and thread ID, so that concurrently started processes
  // do not produce the same identifiers.
  static thread_local std::mt19937 mt(
    std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::high_resolution_clock::now().time_since_epoch())
      .count() +
    std::hash<std::thread::id>()(std::this_thread::get_id()));
  return mt;
}

template<typename T>
static inline T
rand_uniform_distribution(T min, T max) {
  std::uniform_int_distribution<T> distr(min, max);
  return distr(random_mt());
}

uint32_t
UniformUint32(uint32_t min, uint32_t max) {
  return rand_uniform_distribution(min, max);
}

std::string
RandomHex(std::size_t length) {
  static const char digits[] = "0123456789abcdef";
  std::string s(length, '0');
  for(auto& c : s) {
    c = digits[rand_uniform_distribution<uint32_t>(0, 15)];
  }
  return s;
}

std::string
RandomId(const std::string& prefix, std::size_t length) {
  return prefix + "-" + RandomHex(length);
}
}
