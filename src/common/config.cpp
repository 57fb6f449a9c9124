#include "common/config.h"
#include "common/base58.h"
#include <fstream>
#include <limits>
#include <sstream>

namespace palisade {
namespace common {

using json = nlohmann::json;

const char *const SYSTEM_PROGRAM_ADDRESS = "11111111111111111111111111111111";
const char *const TOKEN_PROGRAM_ADDRESS =
    "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";

namespace {

std::string level_name(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "trace";
  case LogLevel::DEBUG:
    return "debug";
  case LogLevel::INFO:
    return "info";
  case LogLevel::WARN:
    return "warn";
  case LogLevel::ERROR:
    return "error";
  case LogLevel::CRITICAL:
    return "critical";
  }
  return "info";
}

bool read_address(const json &document, const char *key, PublicKey &out,
                  std::string &error) {
  auto it = document.find(key);
  if (it == document.end()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string(key) + " must be a base58 string";
    return false;
  }
  auto decoded = base58::decode_pubkey(it->get<std::string>());
  if (!decoded) {
    error = std::string(key) + " is not a valid 32-byte base58 address";
    return false;
  }
  out = *decoded;
  return true;
}

} // namespace

RuntimeConfig RuntimeConfig::defaults() {
  RuntimeConfig config;
  config.system_program_id = *base58::decode_pubkey(SYSTEM_PROGRAM_ADDRESS);
  config.token_program_id = *base58::decode_pubkey(TOKEN_PROGRAM_ADDRESS);
  return config;
}

Result<RuntimeConfig> parse_runtime_config(const json &document) {
  if (!document.is_object()) {
    return make_error(std::string("configuration must be a JSON object"));
  }

  RuntimeConfig config = RuntimeConfig::defaults();
  std::string error;

  if (!document.contains("program_id")) {
    return make_error(std::string("program_id is required"));
  }
  if (!read_address(document, "program_id", config.program_id, error) ||
      !read_address(document, "system_program_id", config.system_program_id,
                    error) ||
      !read_address(document, "token_program_id", config.token_program_id,
                    error)) {
    return make_error(error);
  }

  try {
    if (document.contains("invalid_discriminator_code")) {
      const auto &code = document.at("invalid_discriminator_code");
      constexpr uint64_t max_code = std::numeric_limits<uint32_t>::max();
      bool fits = false;
      if (code.is_number_unsigned()) {
        fits = code.get<uint64_t>() <= max_code;
      } else if (code.is_number_integer()) {
        int64_t signed_code = code.get<int64_t>();
        fits = signed_code >= 0 && static_cast<uint64_t>(signed_code) <= max_code;
      }
      if (!fits) {
        return make_error(
            std::string("invalid_discriminator_code must be an unsigned "
                        "32-bit integer"));
      }
      config.invalid_discriminator_code = code.get<uint32_t>();
    }

    if (document.contains("logging")) {
      const auto &logging = document.at("logging");
      std::string level = logging.value("level", level_name(config.log_level));
      auto parsed = parse_log_level(level);
      if (!parsed) {
        return make_error("unknown log level: " + level);
      }
      config.log_level = *parsed;
      config.json_logs = logging.value("json", config.json_logs);
    }

    if (document.contains("rent")) {
      const auto &rent = document.at("rent");
      config.lamports_per_byte_year =
          rent.value("lamports_per_byte_year", config.lamports_per_byte_year);
      config.exemption_threshold =
          rent.value("exemption_threshold", config.exemption_threshold);
    }
  } catch (const json::exception &e) {
    return make_error(std::string("invalid configuration: ") + e.what());
  }

  return Result<RuntimeConfig>(config);
}

Result<RuntimeConfig> load_runtime_config(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return make_error("could not open config file " + path);
  }

  json document = json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    return make_error("config file " + path + " is not valid JSON");
  }

  auto result = parse_runtime_config(document);
  if (result.is_ok()) {
    LOG_INFO("config", "Loaded runtime configuration from ", path);
  }
  return result;
}

json to_json(const RuntimeConfig &config) {
  json document;
  document["program_id"] = base58::encode(config.program_id);
  document["system_program_id"] = base58::encode(config.system_program_id);
  document["token_program_id"] = base58::encode(config.token_program_id);
  document["invalid_discriminator_code"] = config.invalid_discriminator_code;
  document["logging"] = {{"level", level_name(config.log_level)},
                         {"json", config.json_logs}};
  document["rent"] = {{"lamports_per_byte_year", config.lamports_per_byte_year},
                      {"exemption_threshold", config.exemption_threshold}};
  return document;
}

void apply_logging_config(const RuntimeConfig &config) {
  Logger::instance().set_level(config.log_level);
  Logger::instance().set_json_format(config.json_logs);
}

} // namespace common
} // namespace palisade
