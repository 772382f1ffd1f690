/*
 * pactum/c_api.h — Stable C ABI for driving pactum from other languages.
 *
 * The verification toggle is process-wide; a host embedding C++ libraries
 * built on pactum can switch contract checking on or off, and read
 * statistics and the contract catalog, without touching any C++ type.
 *
 * OWNERSHIP CONTRACT:
 *   - Caller owns all INPUT strings.
 *   - OUTPUT strings are heap-allocated and MUST be released with
 *     pactum_free_string(). Never free() them directly.
 *
 * THREAD SAFETY:
 *   All functions are thread-safe.
 *
 * ABI VERSIONING:
 *   PACTUM_ABI_VERSION is bumped on any breaking change. Callers compare
 *   pactum_abi_version() against the value they were compiled with.
 *
 * EXAMPLE (C):
 *   pactum_configure("{\"contracts_enabled\":true}");
 *   char* stats = pactum_stats_json();
 *   printf("%s\n", stats);
 *   pactum_free_string(stats);
 */

#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Current C ABI version. Bump on any breaking change. */
#define PACTUM_ABI_VERSION 1

uint32_t pactum_abi_version(void);

void pactum_enable_verification(void);
void pactum_disable_verification(void);

/* Returns 1 when verification is enabled, 0 otherwise. */
int pactum_verification_enabled(void);

/*
 * pactum_configure — apply a JSON configuration object.
 *
 * Keys (all optional):
 *   "contracts_enabled": bool   — sets the verification toggle
 *   "event_log_path":    string — JSONL sink for contract events ("" disables)
 *
 * Returns 0 on success, -1 if config_json is NULL or not an object.
 */
int pactum_configure(const char* config_json);

/* Global contract statistics as JSON. NULL only on allocation failure. */
char* pactum_stats_json(void);

/* Catalog of live contracted functions as JSON. NULL only on allocation failure. */
char* pactum_catalog_json(void);

/* Free a string returned by this API. NULL is accepted. */
void pactum_free_string(char* s);

#ifdef __cplusplus
}  /* extern "C" */
#endif
