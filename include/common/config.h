#pragma once

#include "common/logging.h"
#include "common/types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace palisade {
namespace common {

/// Base58 address of the native system program
extern const char *const SYSTEM_PROGRAM_ADDRESS;

/// Base58 address of the SPL token program
extern const char *const TOKEN_PROGRAM_ADDRESS;

/**
 * @brief Process-wide runtime configuration
 *
 * Loaded once at startup. Addresses are decoded from base58 while loading, so
 * a successfully loaded config always holds 32-byte keys.
 *
 * JSON layout (every key optional except "program_id"):
 * @code
 * {
 *   "program_id": "<base58>",
 *   "system_program_id": "<base58>",
 *   "token_program_id": "<base58>",
 *   "invalid_discriminator_code": 6001,
 *   "logging": { "level": "info", "json": false },
 *   "rent": { "lamports_per_byte_year": 3480, "exemption_threshold": 2.0 }
 * }
 * @endcode
 */
struct RuntimeConfig {
  PublicKey program_id;                      ///< Id of the program being served
  PublicKey system_program_id;               ///< Owner of uninitialized accounts
  PublicKey token_program_id;                ///< Owner of token accounts
  uint32_t invalid_discriminator_code = 6001; ///< Custom code for unknown discriminants

  // Logging
  LogLevel log_level = LogLevel::INFO;
  bool json_logs = false;

  // Rent parameters handed to the host
  Lamports lamports_per_byte_year = 3480;
  double exemption_threshold = 2.0;

  /// Defaults with the well-known system and token program ids filled in
  static RuntimeConfig defaults();
};

/**
 * Parse a configuration document.
 * Fails on malformed JSON, a missing or malformed program_id, any malformed
 * address, or an unknown log level.
 */
Result<RuntimeConfig> parse_runtime_config(const nlohmann::json &document);

/// Read and parse a JSON configuration file
Result<RuntimeConfig> load_runtime_config(const std::string &path);

/// Serialize back to the JSON layout accepted by parse_runtime_config()
nlohmann::json to_json(const RuntimeConfig &config);

/// Push log level and format into the global Logger
void apply_logging_config(const RuntimeConfig &config);

} // namespace common
} // namespace palisade
