#pragma once

// pactum/hash.hpp — BLAKE3 hashing for contract fingerprints.
//
// BLAKE3 is the sole hash primitive. Domain separation prefixes keep
// fingerprints of different record types from colliding:
//   "contract:" — canonical ContractSummary JSON
//   "catalog:"  — canonical catalog dump

#include <string>
#include <string_view>

namespace pactum {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// 64-char lowercase hex BLAKE3-256 digest.
std::string blake3_hex(std::string_view payload);

// Domain-separated digest: BLAKE3(domain || payload).
std::string hash_domain(std::string_view domain, std::string_view payload);

HashRuntimeInfo hash_runtime_info();

}  // namespace pactum
