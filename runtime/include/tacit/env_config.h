#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace tacit {

// Canonical env-flag parser shared by the runtime, the compiler and the
// interpreter so every toggle reads the same way.
inline bool parse_env_flag_value(const char* raw, bool fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "0" || value == "false" || value == "False" || value == "off" ||
      value == "OFF" || value == "no" || value == "NO") {
    return false;
  }
  return true;
}

inline bool env_flag_enabled(const char* name, bool fallback) {
  return parse_env_flag_value(std::getenv(name), fallback);
}

inline std::uint64_t env_unsigned_value(const char* name, std::uint64_t fallback) {
  if (const auto* value = std::getenv(name)) {
    char* end = nullptr;
    const auto parsed = std::strtoull(value, &end, 10);
    if (end && end != value && *end == '\0') {
      return static_cast<std::uint64_t>(parsed);
    }
  }
  return fallback;
}

}  // namespace tacit
