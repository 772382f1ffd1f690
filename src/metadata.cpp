#include "pactum/metadata.hpp"
#include "pactum/hash.hpp"
#include "pactum/jsonlite.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace pactum {

namespace {

void append_optional(std::string& out, const char* key, const std::optional<std::string>& v) {
  out += ",\"";
  out += key;
  out += "\":";
  if (!v) {
    out += "null";
    return;
  }
  out += '"';
  out += jsonlite::escape(*v);
  out += '"';
}

}  // namespace

std::string readable_type_name(const std::type_info& info) {
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) return demangled.get();
#endif
  return info.name();
}

ContractSummary ContractMetadata::summarize() const {
  ContractSummary s;
  s.function_name = function_name;
  s.specification = specification;
  s.pre_description = pre_description;
  s.post_description = post_description;
  s.invariant_description = invariant_description;
  if (raises) {
    std::vector<std::string> names;
    names.reserve(raises->size());
    for (const auto& k : *raises) names.push_back(k.name);
    s.raises = std::move(names);
  }
  s.precondition_count = precondition_count();
  s.postcondition_count = postcondition_count();
  s.invariant_count = invariant_count();
  return s;
}

std::string summary_to_json(const ContractSummary& s) {
  std::string out;
  out.reserve(256);
  out += "{\"function\":\"";
  out += jsonlite::escape(s.function_name);
  out += '"';
  append_optional(out, "specification", s.specification);
  append_optional(out, "pre_description", s.pre_description);
  append_optional(out, "post_description", s.post_description);
  append_optional(out, "invariant_description", s.invariant_description);
  out += ",\"raises\":";
  if (!s.raises) {
    out += "null";
  } else {
    out += '[';
    bool first = true;
    for (const auto& name : *s.raises) {
      if (!first) out += ',';
      first = false;
      out += '"';
      out += jsonlite::escape(name);
      out += '"';
    }
    out += ']';
  }
  out += ",\"preconditions\":";
  out += std::to_string(s.precondition_count);
  out += ",\"postconditions\":";
  out += std::to_string(s.postcondition_count);
  out += ",\"invariants\":";
  out += std::to_string(s.invariant_count);
  out += '}';
  return out;
}

std::string contract_fingerprint(const ContractSummary& s) {
  return hash_domain("contract:", summary_to_json(s));
}

}  // namespace pactum
