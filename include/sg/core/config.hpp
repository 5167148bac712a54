#pragma once
#include <atomic>
#include <cstdint>
#include <cstdlib>

namespace sg { namespace config {

// Unsigned decimal from env; `def` on missing, empty or non-digit text.
inline std::uint64_t _env_u64(const char* name, std::uint64_t def) {
  const char* env = std::getenv(name);
  if (!env || !*env) return def;
  std::uint64_t v = 0;
  for (const char* p = env; *p; ++p) {
    if (*p < '0' || *p > '9') return def;
    v = v * 10 + std::uint64_t(*p - '0');
  }
  return v;
}

// ---------- Init seed ----------
//   Env: SG_SEED=<uint64>
inline std::atomic<std::uint64_t>& _seed_flag() {
  static std::atomic<std::uint64_t> s{ _env_u64("SG_SEED", 0xC0FFEEull) };
  return s;
}
inline void set_default_seed(std::uint64_t seed) {
  _seed_flag().store(seed, std::memory_order_relaxed);
}
inline std::uint64_t default_seed() {
  return _seed_flag().load(std::memory_order_relaxed);
}

// ---------- Dump precision ----------
//   Env: SG_PRINT_PRECISION=1..17
inline int _clamp_precision(std::uint64_t p) {
  if (p < 1) return 1;
  if (p > 17) return 17;
  return static_cast<int>(p);
}
inline std::atomic<int>& _precision_flag() {
  static std::atomic<int> p{ _clamp_precision(_env_u64("SG_PRINT_PRECISION", 6)) };
  return p;
}
inline void set_print_precision(int digits) {
  _precision_flag().store(_clamp_precision(digits < 0 ? 0 : std::uint64_t(digits)),
                          std::memory_order_relaxed);
}
inline int print_precision() {
  return _precision_flag().load(std::memory_order_relaxed);
}

}} // namespace sg::config
