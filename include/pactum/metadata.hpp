#pragma once

// pactum/metadata.hpp — Per-function contract metadata carrier.
//
// DESIGN:
//   ContractMetadata holds the descriptive half of a contract: free-text
//   specification/pre/post/invariant descriptions and the declared error
//   kinds. Metadata<R(Args...)> adds the typed predicate sequences.
//
//   One carrier exists per contracted function and is shared (by
//   shared_ptr) with every copy and every layer of wrapping built from it,
//   so metadata and condition transforms can be applied in any order
//   without losing each other's data.
//
// SLOT SEMANTICS:
//   specification, *_description  — single slot, last writer wins
//   raises                         — whole-list replace
//   preconditions, postconditions,
//   invariants                     — append, application order, never overwritten
//
// Descriptive fields never influence control flow.

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "pactum/errors.hpp"

namespace pactum {

// Human-readable name for a type_info; demangled where the ABI allows.
std::string readable_type_name(const std::type_info& info);

template <class E>
std::string error_kind_name() {
  if constexpr (std::is_same_v<E, ContractViolation>)      return "ContractViolation";
  else if constexpr (std::is_same_v<E, PreconditionViolation>)  return "PreconditionViolation";
  else if constexpr (std::is_same_v<E, PostconditionViolation>) return "PostconditionViolation";
  else if constexpr (std::is_same_v<E, InvariantViolation>)     return "InvariantViolation";
  else if constexpr (std::is_same_v<E, ImplementThis>)          return "ImplementThis";
  else if constexpr (std::is_same_v<E, DontImplementThis>)      return "DontImplementThis";
  else return readable_type_name(typeid(E));
}

// A declared error kind. Declared, never enforced.
struct ErrorKind {
  std::type_index type;
  std::string name;

  template <class E>
  static ErrorKind of(std::string display_name = "") {
    return ErrorKind{std::type_index(typeid(E)),
                     display_name.empty() ? error_kind_name<E>() : std::move(display_name)};
  }

  bool operator==(const ErrorKind& other) const { return type == other.type; }
  bool operator!=(const ErrorKind& other) const { return type != other.type; }
};

// ---------------------------------------------------------------------------
// ContractSummary — signature-free snapshot for documentation tooling
// ---------------------------------------------------------------------------
struct ContractSummary {
  std::string function_name;
  std::optional<std::string> specification;
  std::optional<std::string> pre_description;
  std::optional<std::string> post_description;
  std::optional<std::string> invariant_description;
  std::optional<std::vector<std::string>> raises;  // names, declaration order
  std::size_t precondition_count{0};
  std::size_t postcondition_count{0};
  std::size_t invariant_count{0};
};

// Compact JSON with a fixed field order. Absent optionals serialize as null.
std::string summary_to_json(const ContractSummary& s);

// BLAKE3 over summary_to_json() under the "contract:" domain. Stable for
// identical descriptive content and predicate counts.
std::string contract_fingerprint(const ContractSummary& s);

// ---------------------------------------------------------------------------
// ContractMetadata — descriptive carrier, shared by all layers
// ---------------------------------------------------------------------------
struct ContractMetadata {
  explicit ContractMetadata(std::string name) : function_name(std::move(name)) {}
  virtual ~ContractMetadata() = default;

  ContractMetadata(const ContractMetadata&) = delete;
  ContractMetadata& operator=(const ContractMetadata&) = delete;

  std::string function_name;
  std::optional<std::string> specification;
  std::optional<std::string> pre_description;
  std::optional<std::string> post_description;
  std::optional<std::string> invariant_description;
  std::optional<std::vector<ErrorKind>> raises;

  virtual std::size_t precondition_count() const = 0;
  virtual std::size_t postcondition_count() const = 0;
  virtual std::size_t invariant_count() const = 0;

  // True when `E` appears in the declared error list.
  template <class E>
  bool declares() const {
    if (!raises) return false;
    const std::type_index want(typeid(E));
    for (const auto& k : *raises) {
      if (k.type == want) return true;
    }
    return false;
  }

  ContractSummary summarize() const;
};

namespace detail {

template <class T>
using arg_ref_t = const std::remove_cv_t<std::remove_reference_t<T>>&;

template <class R, class... Args>
struct result_predicate {
  using type = std::function<bool(arg_ref_t<R>, arg_ref_t<Args>...)>;
};

template <class... Args>
struct result_predicate<void, Args...> {
  using type = std::function<bool(arg_ref_t<Args>...)>;
};

}  // namespace detail

template <class Sig>
struct Metadata;

// Typed carrier: predicate sequences in application order.
template <class R, class... Args>
struct Metadata<R(Args...)> final : ContractMetadata {
  // Predicate over the call's arguments.
  using Predicate = std::function<bool(detail::arg_ref_t<Args>...)>;
  // Predicate over (result, arguments); over arguments alone for void results.
  using ResultPredicate = typename detail::result_predicate<R, Args...>::type;

  explicit Metadata(std::string name) : ContractMetadata(std::move(name)) {}

  std::vector<Predicate> preconditions;
  std::vector<ResultPredicate> postconditions;
  std::vector<Predicate> invariants;

  std::size_t precondition_count() const override { return preconditions.size(); }
  std::size_t postcondition_count() const override { return postconditions.size(); }
  std::size_t invariant_count() const override { return invariants.size(); }
};

}  // namespace pactum
