#include "pactum/contract.hpp"

namespace pactum {
namespace detail {

namespace {

void emit_violation(const ContractViolation& v) {
  ContractEvent ev;
  ev.type = ContractEventType::violation;
  ev.function_name = v.function_name();
  ev.kind = v.kind();
  ev.detection = v.detection();
  ev.message = v.what();
  ev.verification_enabled = is_verification_enabled();
  emit_contract_event(std::move(ev));
}

template <class V>
[[noreturn]] void emit_and_throw(const V& violation) {
  emit_violation(violation);
  throw violation;
}

}  // namespace

void report_violation(ViolationKind kind, const std::string& function_name, CheckPhase phase) {
  switch (kind) {
    case ViolationKind::precondition:
      emit_and_throw(PreconditionViolation(function_name));
    case ViolationKind::postcondition:
      emit_and_throw(PostconditionViolation(function_name));
    case ViolationKind::invariant:
      emit_and_throw(InvariantViolation(function_name, phase));
  }
  throw_violation(kind, function_name, phase);
}

void report_evaluation_error(ViolationKind kind, const std::string& function_name,
                             const std::string& detail) {
  switch (kind) {
    case ViolationKind::precondition:
      emit_and_throw(PreconditionViolation(function_name, detail));
    case ViolationKind::postcondition:
      emit_and_throw(PostconditionViolation(function_name, detail));
    case ViolationKind::invariant:
      emit_and_throw(InvariantViolation(function_name, detail));
  }
  throw_evaluation_error(kind, function_name, detail);
}

void count_check() {
  global_contract_stats().checks_evaluated.fetch_add(1, std::memory_order_relaxed);
}

void count_call(bool checked) {
  auto& stats = global_contract_stats();
  if (checked) {
    stats.checked_calls.fetch_add(1, std::memory_order_relaxed);
  } else {
    stats.bypassed_calls.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace detail
}  // namespace pactum
