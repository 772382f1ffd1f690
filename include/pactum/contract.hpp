#pragma once

// pactum/contract.hpp — Condition layers and their composition.
//
// USAGE:
//   auto div = pactum::contract<int(int, int)>("div", [](int a, int b) { return a / b; })
//            | pactum::with_specification("Divides two integers")
//            | pactum::with_precondition([](int, int b) { return b != 0; })
//            | pactum::with_postcondition([](int r, int a, int b) { return r == a / b; });
//
// COMPOSITION:
//   A Contracted<Sig> owns the original callable, an ordered list of condition
//   layers, and a shared metadata carrier. Layers nest in application order:
//   the first applied transform is the outermost layer, so the chain reads
//   like a decorator stack from top to bottom.
//     - On the way in, checks run first-applied first.
//     - On the way out, postconditions and invariant post-checks run
//       innermost (last-applied) first.
//   Two stacked preconditions P1 then P2: P1 is checked first and, if both
//   are false, only P1's violation is observed.
//
// LAYER SEMANTICS (verification enabled):
//   precondition  — evaluate; false or evaluation error raises
//                   PreconditionViolation; the inner call never happens.
//   postcondition — call inward first; if that throws, propagate without
//                   checking; then evaluate on (result, args...).
//   invariant     — evaluate before; call inward; evaluate after. A failed
//                   pre-check prevents the call; a throwing call skips the
//                   post-check.
//   Every layer reads the toggle at call time. Disabled layers are pure
//   passthrough and can never raise a violation.
//
// EVALUATION ERRORS:
//   A ContractViolation of any kind thrown from inside a predicate propagates
//   unchanged. Any other exception is wrapped into the violation kind of the
//   evaluating layer, with DetectionMode::evaluation_exception.
//
// ARGUMENTS:
//   The body receives the arguments as lvalues so post-checks observe the
//   same values the body saw. Move-only by-value parameters are therefore
//   not supported.
//
// IDENTITY:
//   Copies of a Contracted share one carrier. Applying a transform yields a
//   new Contracted with one more layer; the carrier it writes to is the same
//   one every earlier copy sees.

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "pactum/catalog.hpp"
#include "pactum/errors.hpp"
#include "pactum/metadata.hpp"
#include "pactum/observability.hpp"
#include "pactum/verification.hpp"

namespace pactum {

namespace detail {

// Build the violation, emit its event, throw it.
[[noreturn]] void report_violation(ViolationKind kind, const std::string& function_name,
                                   CheckPhase phase);
[[noreturn]] void report_evaluation_error(ViolationKind kind, const std::string& function_name,
                                          const std::string& detail);

void count_check();
void count_call(bool checked);

template <class Fn>
void evaluate_condition(ViolationKind kind, CheckPhase phase, const std::string& function_name,
                        Fn&& predicate) {
  count_check();
  bool holds = false;
  try {
    holds = static_cast<bool>(predicate());
  } catch (const ContractViolation&) {
    throw;
  } catch (const std::exception& e) {
    report_evaluation_error(kind, function_name, e.what());
  } catch (...) {
    report_evaluation_error(kind, function_name, "unknown exception");
  }
  if (!holds) report_violation(kind, function_name, phase);
}

}  // namespace detail

template <class Sig>
class Contracted;

template <class R, class... Args>
class Contracted<R(Args...)> {
 public:
  using signature = R(Args...);
  using result_type = R;
  using metadata_type = Metadata<R(Args...)>;
  using predicate_type = typename metadata_type::Predicate;
  using result_predicate_type = typename metadata_type::ResultPredicate;

  Contracted(std::string name, std::function<R(Args...)> body)
      : body_(std::move(body)),
        metadata_(std::make_shared<metadata_type>(std::move(name))) {}

  R operator()(Args... args) const {
    detail::count_call(is_verification_enabled());
    return invoke(0, args...);
  }

  const std::string& name() const { return metadata_->function_name; }

  metadata_type& metadata() { return *metadata_; }
  const metadata_type& metadata() const { return *metadata_; }

  // Shared, signature-free view of the carrier.
  std::shared_ptr<const ContractMetadata> carrier() const { return metadata_; }

  // Number of condition layers wrapped around the body.
  std::size_t layer_count() const { return layers_.size(); }

  // Register the predicate in the carrier and wrap one more layer.
  Contracted& add_precondition(predicate_type predicate) {
    metadata_->preconditions.push_back(predicate);
    layers_.push_back(Layer{ViolationKind::precondition, std::move(predicate), {}});
    return *this;
  }

  Contracted& add_postcondition(result_predicate_type predicate) {
    metadata_->postconditions.push_back(predicate);
    layers_.push_back(Layer{ViolationKind::postcondition, {}, std::move(predicate)});
    return *this;
  }

  Contracted& add_invariant(predicate_type predicate) {
    metadata_->invariants.push_back(predicate);
    layers_.push_back(Layer{ViolationKind::invariant, std::move(predicate), {}});
    return *this;
  }

 private:
  struct Layer {
    ViolationKind kind;
    predicate_type predicate;            // precondition, invariant
    result_predicate_type on_result;     // postcondition
  };

  R invoke(std::size_t depth, Args&... args) const {
    if (depth == layers_.size()) return body_(args...);

    const Layer& layer = layers_[depth];
    const std::string& fn = metadata_->function_name;

    if (layer.kind == ViolationKind::precondition) {
      if (is_verification_enabled()) {
        detail::evaluate_condition(layer.kind, CheckPhase::before, fn,
                                   [&] { return layer.predicate(args...); });
      }
      return invoke(depth + 1, args...);
    }

    if (layer.kind == ViolationKind::invariant) {
      if (is_verification_enabled()) {
        detail::evaluate_condition(layer.kind, CheckPhase::before, fn,
                                   [&] { return layer.predicate(args...); });
      }
      if constexpr (std::is_void_v<R>) {
        invoke(depth + 1, args...);
        if (is_verification_enabled()) {
          detail::evaluate_condition(layer.kind, CheckPhase::after, fn,
                                     [&] { return layer.predicate(args...); });
        }
        return;
      } else {
        R result = invoke(depth + 1, args...);
        if (is_verification_enabled()) {
          detail::evaluate_condition(layer.kind, CheckPhase::after, fn,
                                     [&] { return layer.predicate(args...); });
        }
        return result;
      }
    }

    // postcondition
    if constexpr (std::is_void_v<R>) {
      invoke(depth + 1, args...);
      if (is_verification_enabled()) {
        detail::evaluate_condition(layer.kind, CheckPhase::after, fn,
                                   [&] { return layer.on_result(args...); });
      }
    } else {
      R result = invoke(depth + 1, args...);
      if (is_verification_enabled()) {
        detail::evaluate_condition(layer.kind, CheckPhase::after, fn,
                                   [&] { return layer.on_result(result, args...); });
      }
      return result;
    }
  }

  std::function<R(Args...)> body_;
  std::shared_ptr<metadata_type> metadata_;
  std::vector<Layer> layers_;
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

// Wraps `body` with an empty contract and registers its carrier in the
// global catalog.
template <class Sig, class F>
Contracted<Sig> contract(std::string name, F&& body) {
  Contracted<Sig> fn(std::move(name), std::function<Sig>(std::forward<F>(body)));
  global_contract_catalog().register_carrier(fn.carrier());
  return fn;
}

template <class R, class... Args>
Contracted<R(Args...)> contract(std::string name, R (*body)(Args...)) {
  return contract<R(Args...)>(std::move(name), body);
}

// ---------------------------------------------------------------------------
// Metadata-only transforms
// ---------------------------------------------------------------------------

class DescriptionTransform {
 public:
  DescriptionTransform(std::optional<std::string> ContractMetadata::*slot, std::string text)
      : slot_(slot), text_(std::move(text)) {}

  template <class Sig>
  Contracted<Sig> operator()(Contracted<Sig> fn) const {
    ContractMetadata& carrier = fn.metadata();
    carrier.*slot_ = text_;
    return fn;
  }

 private:
  std::optional<std::string> ContractMetadata::*slot_;
  std::string text_;
};

inline DescriptionTransform with_specification(std::string text) {
  return DescriptionTransform(&ContractMetadata::specification, std::move(text));
}

inline DescriptionTransform with_pre_description(std::string text) {
  return DescriptionTransform(&ContractMetadata::pre_description, std::move(text));
}

inline DescriptionTransform with_post_description(std::string text) {
  return DescriptionTransform(&ContractMetadata::post_description, std::move(text));
}

inline DescriptionTransform with_invariant_description(std::string text) {
  return DescriptionTransform(&ContractMetadata::invariant_description, std::move(text));
}

class DeclaredErrorsTransform {
 public:
  explicit DeclaredErrorsTransform(std::vector<ErrorKind> kinds) : kinds_(std::move(kinds)) {}

  template <class Sig>
  Contracted<Sig> operator()(Contracted<Sig> fn) const {
    fn.metadata().raises = kinds_;
    return fn;
  }

 private:
  std::vector<ErrorKind> kinds_;
};

// Replaces the whole declared list.
inline DeclaredErrorsTransform with_declared_errors(std::vector<ErrorKind> kinds) {
  return DeclaredErrorsTransform(std::move(kinds));
}

template <class... E>
DeclaredErrorsTransform with_declared_errors() {
  return DeclaredErrorsTransform(std::vector<ErrorKind>{ErrorKind::of<E>()...});
}

// ---------------------------------------------------------------------------
// Condition transforms
// ---------------------------------------------------------------------------

template <class P>
class PreconditionTransform {
 public:
  explicit PreconditionTransform(P predicate) : predicate_(std::move(predicate)) {}

  template <class Sig>
  Contracted<Sig> operator()(Contracted<Sig> fn) const {
    fn.add_precondition(predicate_);
    return fn;
  }

 private:
  P predicate_;
};

template <class P>
class PostconditionTransform {
 public:
  explicit PostconditionTransform(P predicate) : predicate_(std::move(predicate)) {}

  template <class Sig>
  Contracted<Sig> operator()(Contracted<Sig> fn) const {
    fn.add_postcondition(predicate_);
    return fn;
  }

 private:
  P predicate_;
};

template <class P>
class InvariantTransform {
 public:
  explicit InvariantTransform(P predicate) : predicate_(std::move(predicate)) {}

  template <class Sig>
  Contracted<Sig> operator()(Contracted<Sig> fn) const {
    fn.add_invariant(predicate_);
    return fn;
  }

 private:
  P predicate_;
};

template <class P>
PreconditionTransform<std::decay_t<P>> with_precondition(P&& predicate) {
  return PreconditionTransform<std::decay_t<P>>(std::forward<P>(predicate));
}

template <class P>
PostconditionTransform<std::decay_t<P>> with_postcondition(P&& predicate) {
  return PostconditionTransform<std::decay_t<P>>(std::forward<P>(predicate));
}

template <class P>
InvariantTransform<std::decay_t<P>> with_invariant(P&& predicate) {
  return InvariantTransform<std::decay_t<P>>(std::forward<P>(predicate));
}

// fn | transform  ==  transform(fn)
template <class Sig, class Transform>
auto operator|(Contracted<Sig> fn, const Transform& transform)
    -> decltype(transform(std::move(fn))) {
  return transform(std::move(fn));
}

}  // namespace pactum
