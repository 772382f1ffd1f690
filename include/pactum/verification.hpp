#pragma once

// pactum/verification.hpp — Process-wide verification toggle and runtime config.
//
// DESIGN:
//   A single atomic boolean gates every condition layer. Layers read it at
//   invocation time, so checking can be switched on or off around arbitrary
//   call sites without re-wrapping any function.
//
// DEFAULT:
//   Seeded once, on first access, from CONTRACTS_ENABLED. Recognized truthy
//   tokens (case-insensitive): "1", "true", "yes". Anything else, including
//   absence or the empty string, leaves verification disabled.
//
// CONCURRENCY:
//   The cell is std::atomic<bool>. Toggling while other threads call
//   contracted functions is race-free, but a call that already passed its
//   entry check is not interrupted by a later disable.
//
// ENVIRONMENT:
//   CONTRACTS_ENABLED  — default state of the toggle
//   PACTUM_EVENT_LOG   — JSONL sink for contract events (see observability.hpp)

#include <string>
#include <string_view>

namespace pactum {

struct RuntimeConfig {
  bool contracts_enabled{false};
  std::string event_log_path;  // empty = no JSONL sink
};

// Reads CONTRACTS_ENABLED and PACTUM_EVENT_LOG. Never throws.
RuntimeConfig load_config_from_env();

// True for "1", "true", "yes" in any letter case. Surrounding whitespace is not trimmed.
bool parse_truthy(std::string_view token);

void enable_verification();
void disable_verification();
bool is_verification_enabled();

// Sets the toggle and returns its previous value.
bool set_verification_enabled(bool enabled);

// Holds the toggle at a fixed value for the lifetime of the guard and restores
// the previous value on destruction.
class ScopedVerification {
 public:
  explicit ScopedVerification(bool enabled);
  ~ScopedVerification();

  ScopedVerification(const ScopedVerification&) = delete;
  ScopedVerification& operator=(const ScopedVerification&) = delete;

  bool previous() const { return previous_; }

 private:
  bool previous_;
};

}  // namespace pactum
