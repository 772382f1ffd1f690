#include "pactum/catalog.hpp"
#include "pactum/hash.hpp"

#include <algorithm>

namespace pactum {

void ContractCatalog::prune_locked() const {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [](const Entry& e) { return e.carrier.expired(); }),
                 entries_.end());
}

void ContractCatalog::register_carrier(const std::shared_ptr<const ContractMetadata>& carrier) {
  if (!carrier) return;
  std::lock_guard<std::mutex> lk(mu_);
  prune_locked();
  for (const auto& e : entries_) {
    if (e.identity == carrier.get()) return;
  }
  entries_.push_back(Entry{carrier.get(), carrier});
}

std::optional<ContractSummary> ContractCatalog::lookup(const std::string& function_name) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    auto live = it->carrier.lock();
    if (live && live->function_name == function_name) return live->summarize();
  }
  return std::nullopt;
}

std::vector<ContractSummary> ContractCatalog::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  prune_locked();
  std::vector<ContractSummary> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    if (auto live = e.carrier.lock()) out.push_back(live->summarize());
  }
  return out;
}

std::size_t ContractCatalog::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  prune_locked();
  return entries_.size();
}

std::string ContractCatalog::to_json() const {
  const auto summaries = snapshot();
  std::string body = "[";
  bool first = true;
  for (const auto& s : summaries) {
    if (!first) body += ',';
    first = false;
    body += summary_to_json(s);
  }
  body += ']';

  std::string out;
  out.reserve(body.size() + 96);
  out += "{\"contracts\":";
  out += body;
  out += ",\"fingerprint\":\"";
  out += hash_domain("catalog:", body);
  out += "\"}";
  return out;
}

void ContractCatalog::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
}

ContractCatalog& global_contract_catalog() {
  static ContractCatalog inst;
  return inst;
}

}  // namespace pactum
