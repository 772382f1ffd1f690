#include "pactum/errors.hpp"

#include <utility>

namespace pactum {

namespace {

std::string evaluation_message(const char* what, const std::string& function_name,
                               const std::string& detail) {
  return std::string("Error evaluating ") + what + " for " + function_name + ": " + detail;
}

}  // namespace

std::string to_string(ViolationKind kind) {
  switch (kind) {
    case ViolationKind::precondition:  return "precondition";
    case ViolationKind::postcondition: return "postcondition";
    case ViolationKind::invariant:     return "invariant";
  }
  return "unknown";
}

std::string to_string(DetectionMode mode) {
  switch (mode) {
    case DetectionMode::predicate_false:      return "predicate_false";
    case DetectionMode::evaluation_exception: return "evaluation_exception";
  }
  return "unknown";
}

ContractViolation::ContractViolation(ViolationKind kind, std::string function_name,
                                     DetectionMode detection, const std::string& message,
                                     std::string detail)
    : std::logic_error(message),
      kind_(kind),
      detection_(detection),
      function_name_(std::move(function_name)),
      detail_(std::move(detail)) {}

// ---------------------------------------------------------------------------
// Leaf kinds
// ---------------------------------------------------------------------------

PreconditionViolation::PreconditionViolation(std::string function_name)
    : ContractViolation(ViolationKind::precondition, function_name,
                        DetectionMode::predicate_false,
                        "Precondition violated for function " + function_name) {}

PreconditionViolation::PreconditionViolation(std::string function_name, std::string detail)
    : ContractViolation(ViolationKind::precondition, function_name,
                        DetectionMode::evaluation_exception,
                        evaluation_message("precondition", function_name, detail),
                        detail) {}

PostconditionViolation::PostconditionViolation(std::string function_name)
    : ContractViolation(ViolationKind::postcondition, function_name,
                        DetectionMode::predicate_false,
                        "Postcondition violated for function " + function_name) {}

PostconditionViolation::PostconditionViolation(std::string function_name, std::string detail)
    : ContractViolation(ViolationKind::postcondition, function_name,
                        DetectionMode::evaluation_exception,
                        evaluation_message("postcondition", function_name, detail),
                        detail) {}

InvariantViolation::InvariantViolation(std::string function_name, CheckPhase phase)
    : ContractViolation(ViolationKind::invariant, function_name,
                        DetectionMode::predicate_false,
                        std::string("Invariant violated ") +
                            (phase == CheckPhase::before ? "before" : "after") +
                            " execution of " + function_name),
      phase_(phase),
      has_phase_(true) {}

InvariantViolation::InvariantViolation(std::string function_name, std::string detail)
    : ContractViolation(ViolationKind::invariant, function_name,
                        DetectionMode::evaluation_exception,
                        evaluation_message("invariant", function_name, detail),
                        detail) {}

// ---------------------------------------------------------------------------
// throw helpers
// ---------------------------------------------------------------------------

void throw_violation(ViolationKind kind, const std::string& function_name, CheckPhase phase) {
  switch (kind) {
    case ViolationKind::precondition:
      throw PreconditionViolation(function_name);
    case ViolationKind::postcondition:
      throw PostconditionViolation(function_name);
    case ViolationKind::invariant:
      throw InvariantViolation(function_name, phase);
  }
  throw ContractViolation(kind, function_name, DetectionMode::predicate_false,
                          "Contract violated for function " + function_name);
}

void throw_evaluation_error(ViolationKind kind, const std::string& function_name,
                            const std::string& detail) {
  switch (kind) {
    case ViolationKind::precondition:
      throw PreconditionViolation(function_name, detail);
    case ViolationKind::postcondition:
      throw PostconditionViolation(function_name, detail);
    case ViolationKind::invariant:
      throw InvariantViolation(function_name, detail);
  }
  throw ContractViolation(kind, function_name, DetectionMode::evaluation_exception,
                          "Error evaluating contract for " + function_name + ": " + detail,
                          detail);
}

}  // namespace pactum
