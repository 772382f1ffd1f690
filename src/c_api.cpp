#include "pactum/c_api.h"

// Wraps the C++ API behind a pure-C boundary. No C++ exception crosses it:
// allocation failures surface as NULL results.

#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

#include "pactum/catalog.hpp"
#include "pactum/jsonlite.hpp"
#include "pactum/observability.hpp"
#include "pactum/verification.hpp"

namespace {

char* dup_string(const std::string& s) {
  char* out = static_cast<char*>(std::malloc(s.size() + 1));
  if (!out) return nullptr;
  std::memcpy(out, s.c_str(), s.size() + 1);
  return out;
}

bool looks_like_object(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  const auto last = s.find_last_not_of(" \t\r\n");
  return first != std::string::npos && s[first] == '{' && s[last] == '}';
}

}  // namespace

extern "C" {

uint32_t pactum_abi_version(void) {
  return PACTUM_ABI_VERSION;
}

void pactum_enable_verification(void) {
  pactum::enable_verification();
}

void pactum_disable_verification(void) {
  pactum::disable_verification();
}

int pactum_verification_enabled(void) {
  return pactum::is_verification_enabled() ? 1 : 0;
}

int pactum_configure(const char* config_json) {
  if (!config_json) return -1;
  try {
    const std::string cfg(config_json);
    if (!looks_like_object(cfg)) return -1;

    if (pactum::jsonlite::has_key(cfg, "event_log_path")) {
      pactum::set_event_log_path(pactum::jsonlite::get_string(cfg, "event_log_path", ""));
    }
    if (pactum::jsonlite::has_key(cfg, "contracts_enabled")) {
      pactum::set_verification_enabled(
          pactum::jsonlite::get_bool(cfg, "contracts_enabled", pactum::is_verification_enabled()));
    }
    return 0;
  } catch (const std::exception&) {
    return -1;
  }
}

char* pactum_stats_json(void) {
  try {
    return dup_string(pactum::global_contract_stats().to_json());
  } catch (const std::exception&) {
    return nullptr;
  }
}

char* pactum_catalog_json(void) {
  try {
    return dup_string(pactum::global_contract_catalog().to_json());
  } catch (const std::exception&) {
    return nullptr;
  }
}

void pactum_free_string(char* s) {
  std::free(s);
}

}  // extern "C"
