// pactum_demo — exercises the contract engine on the example functions.
//
//   pactum_demo run       div/sqrt walkthrough with verification enabled (default)
//   pactum_demo company   company resolver stub
//   pactum_demo catalog   catalog of the example contracts as JSON
//   pactum_demo health    hash primitive, verification state, C ABI version

#include <iostream>
#include <stdexcept>
#include <string>

#include "arithmetic.hpp"
#include "company_resolver.hpp"
#include "pactum/catalog.hpp"
#include "pactum/hash.hpp"
#include "pactum/observability.hpp"
#include "pactum/verification.hpp"
#include "pactum/c_api.h"

namespace {

int run_arithmetic() {
  pactum::enable_verification();

  std::cout << "Testing div function with contracts enabled...\n";
  for (int b : {2, 0}) {
    try {
      const int result = pactum::examples::div()(10, b);
      std::cout << "div(10, " << b << ") = " << result << "\n";
    } catch (const pactum::ContractViolation& e) {
      std::cout << "Error: " << e.what() << "\n";
    }
  }

  std::cout << "\nTesting div with contracts disabled...\n";
  {
    pactum::ScopedVerification off(false);
    try {
      std::cout << "div(10, 0) = " << pactum::examples::div()(10, 0) << "\n";
    } catch (const std::domain_error& e) {
      std::cout << "Error: " << e.what() << "\n";
    }
  }

  std::cout << "\nTesting unimplemented sqrt function...\n";
  try {
    std::cout << "sqrt(4.0) = " << pactum::examples::sqrt()(4.0) << "\n";
  } catch (const pactum::ImplementThis& e) {
    std::cout << "Implementation needed: " << e.what() << "\n";
  }

  std::cout << "\n" << pactum::global_contract_stats().to_json() << "\n";
  return 0;
}

int run_company() {
  const std::string text = "Apple Inc. and Microsoft Corporation are major tech companies.";
  try {
    const auto found =
        pactum::examples::resolve_company_names()(text, pactum::examples::sample_company_database());
    std::cout << "Resolved companies: " << found.size() << "\n";
  } catch (const pactum::ImplementThis& e) {
    std::cout << "Implementation needed: " << e.what() << "\n";
  }
  return 0;
}

int run_catalog() {
  // Touch each example so its carrier is registered.
  (void)pactum::examples::div();
  (void)pactum::examples::sqrt();
  (void)pactum::examples::resolve_company_names();
  std::cout << pactum::global_contract_catalog().to_json() << "\n";
  return 0;
}

int run_health() {
  const auto h = pactum::hash_runtime_info();
  std::cout << "{\"hash_primitive\":\"" << h.primitive
            << "\",\"hash_version\":\"" << h.version
            << "\",\"verification_enabled\":"
            << (pactum::is_verification_enabled() ? "true" : "false")
            << ",\"abi_version\":" << pactum_abi_version()
            << "}\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd = "run";
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }

  if (cmd == "run") return run_arithmetic();
  if (cmd == "company") return run_company();
  if (cmd == "catalog") return run_catalog();
  if (cmd == "health") return run_health();

  std::cerr << "{\"error\":\"unknown command: " << cmd << "\"}\n";
  return 1;
}
