#pragma once

// pactum/catalog.hpp — Process-wide side table of contracted functions.
//
// DESIGN:
//   Every carrier created by contract() is registered here, keyed by the
//   carrier's identity (its address). Documentation and introspection tooling
//   reads summaries from the catalog without knowing any function signature.
//
// OWNERSHIP:
//   The catalog holds weak references only. A contracted function that goes
//   out of scope disappears from snapshots; its entry is pruned lazily on the
//   next registration or snapshot.
//
// CONCURRENCY:
//   All operations take an internal mutex. Summaries are copied out under the
//   lock; callers never see a carrier being mutated concurrently as long as
//   decoration happens before the function is shared across threads.

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pactum/metadata.hpp"

namespace pactum {

class ContractCatalog {
 public:
  // Registers a carrier. Registering the same carrier twice is a no-op.
  void register_carrier(const std::shared_ptr<const ContractMetadata>& carrier);

  // Most recently registered live carrier with this function name.
  std::optional<ContractSummary> lookup(const std::string& function_name) const;

  // Live carriers in registration order.
  std::vector<ContractSummary> snapshot() const;

  // Number of live carriers.
  std::size_t size() const;

  // {"contracts":[<summary>...],"fingerprint":"<blake3>"}
  std::string to_json() const;

  // Drops every entry. Test support.
  void clear();

 private:
  struct Entry {
    const ContractMetadata* identity{nullptr};
    std::weak_ptr<const ContractMetadata> carrier;
  };

  void prune_locked() const;

  mutable std::mutex mu_;
  mutable std::vector<Entry> entries_;
};

ContractCatalog& global_contract_catalog();

}  // namespace pactum
