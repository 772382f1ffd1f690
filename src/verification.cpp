#include "pactum/verification.hpp"
#include "pactum/observability.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>

namespace pactum {

namespace {

std::atomic<bool>& toggle_cell() {
  // Function-local static: the environment is consulted exactly once, on
  // first use, regardless of static initialization order across TUs.
  static std::atomic<bool> cell{load_config_from_env().contracts_enabled};
  return cell;
}

void emit_toggle_event(bool enabled) {
  ContractEvent ev;
  ev.type = ContractEventType::toggle;
  ev.verification_enabled = enabled;
  ev.message = enabled ? "verification enabled" : "verification disabled";
  emit_contract_event(ev);
}

}  // namespace

bool parse_truthy(std::string_view token) {
  std::string lowered;
  lowered.reserve(token.size());
  for (char c : token) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lowered == "1" || lowered == "true" || lowered == "yes";
}

RuntimeConfig load_config_from_env() {
  RuntimeConfig cfg;
  if (const char* e = std::getenv("CONTRACTS_ENABLED")) {
    cfg.contracts_enabled = parse_truthy(e);
  }
  if (const char* e = std::getenv("PACTUM_EVENT_LOG")) {
    if (e[0]) cfg.event_log_path = e;
  }
  return cfg;
}

bool set_verification_enabled(bool enabled) {
  const bool previous = toggle_cell().exchange(enabled, std::memory_order_acq_rel);
  if (previous != enabled) {
    emit_toggle_event(enabled);
  }
  return previous;
}

void enable_verification() { set_verification_enabled(true); }

void disable_verification() { set_verification_enabled(false); }

bool is_verification_enabled() {
  return toggle_cell().load(std::memory_order_acquire);
}

// ---------------------------------------------------------------------------
// ScopedVerification
// ---------------------------------------------------------------------------

ScopedVerification::ScopedVerification(bool enabled)
    : previous_(set_verification_enabled(enabled)) {}

ScopedVerification::~ScopedVerification() {
  set_verification_enabled(previous_);
}

}  // namespace pactum
