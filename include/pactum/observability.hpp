#pragma once

// pactum/observability.hpp — Contract event stream and global statistics.
//
// DESIGN:
//   ContractEvent is the observable unit. One event is emitted for every
//   violation raised by a condition layer and for every change of the
//   verification toggle. Each event is:
//     - always folded into the global ContractStats counters;
//     - forwarded to the installed hook, if any; otherwise
//     - appended as one JSON line to the file named by PACTUM_EVENT_LOG.
//
// INVARIANTS:
//   - Event emission never throws and never changes the outcome of a call:
//     the violation is raised whether or not the sink accepted the event.
//     A hook or file sink that fails is counted in ContractStats::sink_errors.
//   - Passing checks do not emit events; they only bump counters.

#include <atomic>
#include <cstdint>
#include <string>

#include "pactum/errors.hpp"

namespace pactum {

enum class ContractEventType {
  violation,
  toggle,
};

std::string to_string(ContractEventType type);

struct ContractEvent {
  ContractEventType type{ContractEventType::violation};
  std::string function_name;                              // empty for toggle events
  ViolationKind kind{ViolationKind::precondition};        // meaningful for violations only
  DetectionMode detection{DetectionMode::predicate_false};
  std::string message;
  bool verification_enabled{true};
  uint64_t timestamp_unix_ms{0};                          // stamped by emit_contract_event

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// ContractStats — global aggregated counters
// ---------------------------------------------------------------------------
// Thread-safe. All counters are relaxed atomics; to_json() is a best-effort
// snapshot, not a consistent cut across counters.
class ContractStats {
 public:
  void record_event(const ContractEvent& ev);
  void reset();
  std::string to_json() const;

  // Calls that entered a contracted function while verification was on / off.
  alignas(64) std::atomic<uint64_t> checked_calls{0};
  alignas(64) std::atomic<uint64_t> bypassed_calls{0};

  // Individual predicate evaluations (an invariant counts twice per call).
  alignas(64) std::atomic<uint64_t> checks_evaluated{0};

  alignas(64) std::atomic<uint64_t> precondition_violations{0};
  alignas(64) std::atomic<uint64_t> postcondition_violations{0};
  alignas(64) std::atomic<uint64_t> invariant_violations{0};

  // Subset of the violations above raised because a predicate threw.
  alignas(64) std::atomic<uint64_t> evaluation_errors{0};

  alignas(64) std::atomic<uint64_t> toggle_changes{0};

  // Events the hook or the JSONL sink failed to accept.
  alignas(64) std::atomic<uint64_t> sink_errors{0};

  uint64_t total_violations() const;
};

ContractStats& global_contract_stats();

// Record and dispatch an event. Never throws, whatever the hook does.
void emit_contract_event(ContractEvent ev) noexcept;

// Optional hook; replaces the JSONL sink while installed. Pass nullptr to remove.
using ContractEventHook = void (*)(const ContractEvent&);
void set_contract_event_hook(ContractEventHook hook);

// Overrides PACTUM_EVENT_LOG. An empty path disables the JSONL sink.
void set_event_log_path(const std::string& path);
std::string event_log_path();

}  // namespace pactum
