#include "common/base58.h"
#include "common/config.h"
#include "common/logging.h"
#include "counter_program.h"
#include "runtime/local_bank.h"
#include <iostream>
#include <string>

using namespace palisade;
using namespace palisade::common;
using namespace palisade::runtime;

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Runs the counter program against an in-memory bank."
            << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config FILE              Path to JSON configuration file"
            << std::endl;
  std::cout << "  --log-level LEVEL          Log level (trace, debug, info, "
               "warn, error)"
            << std::endl;
  std::cout << "  --json-logs                Emit log lines as JSON" << std::endl;
  std::cout << "  --increments N             Increments to apply (default: 3)"
            << std::endl;
  std::cout << "  --help                     Show this help message"
            << std::endl;
}

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string log_level;
  bool json_logs = false;
  int increments = 3;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--json-logs") {
      json_logs = true;
    } else if (arg == "--increments" && i + 1 < argc) {
      try {
        increments = std::stoi(argv[++i]);
      } catch (const std::exception &e) {
        std::cerr << "Invalid --increments value: " << e.what() << std::endl;
        return 1;
      }
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  RuntimeConfig config = RuntimeConfig::defaults();
  if (auto program_id = base58::decode_pubkey(counter::COUNTER_PROGRAM_ADDRESS)) {
    config.program_id = *program_id;
  }

  if (!config_path.empty()) {
    auto loaded = load_runtime_config(config_path);
    if (loaded.is_err()) {
      std::cerr << "Failed to load config " << config_path << ": "
                << loaded.error() << std::endl;
      return 1;
    }
    config = loaded.value();
  }

  if (!log_level.empty()) {
    auto level = parse_log_level(log_level);
    if (!level) {
      std::cerr << "Unknown log level: " << log_level << std::endl;
      return 1;
    }
    config.log_level = *level;
  }
  if (json_logs) {
    config.json_logs = true;
  }
  apply_logging_config(config);

  SchemaRegistry registry(config.invalid_discriminator_code);
  if (!counter::register_counter_program(registry)) {
    LOG_ERROR("main", "Counter program registration failed");
    return 1;
  }

  Sha256AddressDeriver deriver;
  Dispatcher dispatcher(registry, ProgramIds::from_config(config), deriver);
  LocalBank bank(config);

  PublicKey owner(PUBKEY_BYTES, 0);
  owner[0] = 0x42;
  bank.set_account(owner, 1000000000, config.system_program_id);

  auto derived = dispatcher.pda().derive(counter::counter_seeds(owner),
                                         config.program_id);
  if (derived.is_err()) {
    LOG_ERROR("main", "Could not derive counter address: ",
              derived.error().to_string());
    return 1;
  }
  const PublicKey &counter_key = derived.value().address;

  LOG_INFO("main", "Program ", base58::encode(config.program_id));
  LOG_INFO("main", "Counter ", base58::encode(counter_key), " bump ",
           static_cast<int>(derived.value().bump));

  std::vector<AccountMeta> init_accounts = {
      AccountMeta::signer(owner, true), AccountMeta::writable(counter_key),
      AccountMeta::readonly(config.system_program_id)};
  std::vector<AccountMeta> update_accounts = {
      AccountMeta::signer(owner), AccountMeta::writable(counter_key)};

  auto report = [&](const char *label, const DispatchOutcome &outcome) {
    if (outcome.is_success()) {
      LOG_INFO("main", label, " succeeded");
    } else {
      LOG_WARN("main", label, " failed: ", registry.describe(*outcome.failure),
               " code=", outcome.error_code());
    }
    return outcome.is_success();
  };

  if (!report("InitializeCounter",
              bank.invoke(dispatcher, init_accounts,
                          counter::instruction_data(
                              counter::CounterInstruction::INITIALIZE_COUNTER)))) {
    return 1;
  }

  for (int i = 0; i < increments; ++i) {
    report("Increment",
           bank.invoke(dispatcher, update_accounts,
                       counter::instruction_data(
                           counter::CounterInstruction::INCREMENT)));
  }
  report("Decrement",
         bank.invoke(dispatcher, update_accounts,
                     counter::instruction_data(
                         counter::CounterInstruction::DECREMENT)));

  // Unknown discriminant is rejected with the program's error code
  report("Discriminant 9", bank.invoke(dispatcher, update_accounts, {9}));

  auto stored = bank.get_account(counter_key);
  if (!stored) {
    LOG_ERROR("main", "Counter account missing after initialization");
    return 1;
  }
  auto state = load<counter::Counter>(AccountHandle(&*stored));
  if (state.is_err()) {
    LOG_ERROR("main", "Counter state unreadable: ", state.error().to_string());
    return 1;
  }
  std::cout << "count=" << state.value()->get_count()
            << " lamports=" << stored->lamports << std::endl;

  auto stats = dispatcher.get_stats();
  LOG_INFO("main", "Dispatched ", stats.dispatched, " succeeded ",
           stats.succeeded, " failed ", stats.failed);
  return 0;
}
