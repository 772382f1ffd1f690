#pragma once

// pactum/errors.hpp — Violation taxonomy and stub markers.
//
// TAXONOMY:
//   ContractViolation           — common base, catch-all for broken contracts
//     PreconditionViolation     — predicate over arguments failed before the call
//     PostconditionViolation    — predicate over (result, arguments) failed after the call
//     InvariantViolation        — predicate over arguments failed before or after the call
//
//   ImplementThis               — function body is an intentional stub
//   DontImplementThis           — function must be skipped by automated implementation
//
// INVARIANTS:
//   - The stub markers never derive from ContractViolation. A handler that
//     catches ContractViolation never sees "unimplemented".
//   - Every violation names the offending function and records how it was
//     detected (predicate returned false vs. predicate evaluation threw).

#include <stdexcept>
#include <string>

namespace pactum {

enum class ViolationKind {
  precondition,
  postcondition,
  invariant,
};

std::string to_string(ViolationKind kind);

// How the violation was detected.
enum class DetectionMode {
  predicate_false,       // predicate evaluated to false
  evaluation_exception,  // predicate evaluation exited via an exception
};

std::string to_string(DetectionMode mode);

// Which side of the call an invariant check ran on.
enum class CheckPhase {
  before,
  after,
};

class ContractViolation : public std::logic_error {
 public:
  ContractViolation(ViolationKind kind, std::string function_name,
                    DetectionMode detection, const std::string& message,
                    std::string detail = "");

  ViolationKind kind() const noexcept { return kind_; }
  DetectionMode detection() const noexcept { return detection_; }
  const std::string& function_name() const noexcept { return function_name_; }

  // Description of the error raised while evaluating the predicate.
  // Empty when the predicate simply returned false.
  const std::string& detail() const noexcept { return detail_; }

 private:
  ViolationKind kind_;
  DetectionMode detection_;
  std::string function_name_;
  std::string detail_;
};

class PreconditionViolation : public ContractViolation {
 public:
  explicit PreconditionViolation(std::string function_name);
  PreconditionViolation(std::string function_name, std::string detail);
};

class PostconditionViolation : public ContractViolation {
 public:
  explicit PostconditionViolation(std::string function_name);
  PostconditionViolation(std::string function_name, std::string detail);
};

class InvariantViolation : public ContractViolation {
 public:
  InvariantViolation(std::string function_name, CheckPhase phase);
  InvariantViolation(std::string function_name, std::string detail);

  // Set only for predicate_false violations; evaluation errors carry no phase.
  bool has_phase() const noexcept { return has_phase_; }
  CheckPhase phase() const noexcept { return phase_; }

 private:
  CheckPhase phase_{CheckPhase::before};
  bool has_phase_{false};
};

// Logical hole: raise from a stub whose implementation is still pending.
class ImplementThis : public std::logic_error {
 public:
  explicit ImplementThis(const std::string& message = "not yet implemented")
      : std::logic_error(message) {}
};

// Raise from a stub that automated implementation tools must leave alone.
class DontImplementThis : public std::logic_error {
 public:
  explicit DontImplementThis(const std::string& message = "intentionally not implemented")
      : std::logic_error(message) {}
};

// Throws the violation matching `kind`. Used by the condition layers.
[[noreturn]] void throw_violation(ViolationKind kind, const std::string& function_name,
                                  CheckPhase phase);
[[noreturn]] void throw_evaluation_error(ViolationKind kind, const std::string& function_name,
                                         const std::string& detail);

}  // namespace pactum
