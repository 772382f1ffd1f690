#include "pactum/observability.hpp"
#include "pactum/jsonlite.hpp"
#include "pactum/verification.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <mutex>
#include <stdexcept>

namespace pactum {

std::string to_string(ContractEventType type) {
  switch (type) {
    case ContractEventType::violation: return "violation";
    case ContractEventType::toggle:    return "toggle";
  }
  return "unknown";
}

std::string ContractEvent::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"type\":\"";
  out += to_string(type);
  out += "\"";
  if (type == ContractEventType::violation) {
    out += ",\"function\":\"";
    out += jsonlite::escape(function_name);
    out += "\",\"kind\":\"";
    out += to_string(kind);
    out += "\",\"detection\":\"";
    out += to_string(detection);
    out += "\"";
  }
  out += ",\"message\":\"";
  out += jsonlite::escape(message);
  out += "\",\"verification_enabled\":";
  out += verification_enabled ? "true" : "false";
  out += ",\"timestamp_unix_ms\":";
  out += std::to_string(timestamp_unix_ms);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ContractStats
// ---------------------------------------------------------------------------

void ContractStats::record_event(const ContractEvent& ev) {
  if (ev.type == ContractEventType::toggle) {
    toggle_changes.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  switch (ev.kind) {
    case ViolationKind::precondition:
      precondition_violations.fetch_add(1, std::memory_order_relaxed);
      break;
    case ViolationKind::postcondition:
      postcondition_violations.fetch_add(1, std::memory_order_relaxed);
      break;
    case ViolationKind::invariant:
      invariant_violations.fetch_add(1, std::memory_order_relaxed);
      break;
  }
  if (ev.detection == DetectionMode::evaluation_exception) {
    evaluation_errors.fetch_add(1, std::memory_order_relaxed);
  }
}

void ContractStats::reset() {
  checked_calls.store(0, std::memory_order_relaxed);
  bypassed_calls.store(0, std::memory_order_relaxed);
  checks_evaluated.store(0, std::memory_order_relaxed);
  precondition_violations.store(0, std::memory_order_relaxed);
  postcondition_violations.store(0, std::memory_order_relaxed);
  invariant_violations.store(0, std::memory_order_relaxed);
  evaluation_errors.store(0, std::memory_order_relaxed);
  toggle_changes.store(0, std::memory_order_relaxed);
  sink_errors.store(0, std::memory_order_relaxed);
}

uint64_t ContractStats::total_violations() const {
  return precondition_violations.load(std::memory_order_relaxed) +
         postcondition_violations.load(std::memory_order_relaxed) +
         invariant_violations.load(std::memory_order_relaxed);
}

std::string ContractStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"verification_enabled\":";
  out += is_verification_enabled() ? "true" : "false";
  out += ",\"calls\":{\"checked\":";
  out += std::to_string(checked_calls.load(std::memory_order_relaxed));
  out += ",\"bypassed\":";
  out += std::to_string(bypassed_calls.load(std::memory_order_relaxed));
  out += "},\"checks_evaluated\":";
  out += std::to_string(checks_evaluated.load(std::memory_order_relaxed));
  out += ",\"violations\":{\"precondition\":";
  out += std::to_string(precondition_violations.load(std::memory_order_relaxed));
  out += ",\"postcondition\":";
  out += std::to_string(postcondition_violations.load(std::memory_order_relaxed));
  out += ",\"invariant\":";
  out += std::to_string(invariant_violations.load(std::memory_order_relaxed));
  out += ",\"total\":";
  out += std::to_string(total_violations());
  out += ",\"evaluation_errors\":";
  out += std::to_string(evaluation_errors.load(std::memory_order_relaxed));
  out += "},\"toggle_changes\":";
  out += std::to_string(toggle_changes.load(std::memory_order_relaxed));
  out += ",\"sink_errors\":";
  out += std::to_string(sink_errors.load(std::memory_order_relaxed));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

ContractStats& global_contract_stats() {
  static ContractStats inst;
  return inst;
}

namespace {

std::atomic<ContractEventHook> g_event_hook{nullptr};

struct EventLogState {
  std::mutex mu;
  bool overridden{false};
  std::string path;
};

EventLogState& event_log_state() {
  static EventLogState state;
  return state;
}

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch())
          .count());
}

// Custom hook replaces the file sink; otherwise one JSON object per line.
void deliver(const ContractEvent& ev) {
  ContractEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const std::string path = event_log_path();
  if (path.empty()) return;

  const std::string line = ev.to_json() + "\n";
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) throw std::runtime_error("cannot open event log: " + path);
  const std::size_t written = std::fwrite(line.data(), 1, line.size(), f);
  std::fclose(f);
  if (written != line.size()) throw std::runtime_error("short write to event log: " + path);
}

}  // namespace

void set_contract_event_hook(ContractEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  auto& st = event_log_state();
  std::lock_guard<std::mutex> lk(st.mu);
  st.path = path;
  st.overridden = true;
}

std::string event_log_path() {
  auto& st = event_log_state();
  std::lock_guard<std::mutex> lk(st.mu);
  if (st.overridden) return st.path;
  return load_config_from_env().event_log_path;
}

void emit_contract_event(ContractEvent ev) noexcept {
  ev.timestamp_unix_ms = now_unix_ms();

  // 1. Record in global stats (always).
  global_contract_stats().record_event(ev);

  // 2. Deliver. Sink failures are counted, never propagated.
  try {
    deliver(ev);
  } catch (const std::exception&) {
    global_contract_stats().sink_errors.fetch_add(1, std::memory_order_relaxed);
  } catch (...) {
    global_contract_stats().sink_errors.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace pactum
