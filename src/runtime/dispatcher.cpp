#include "runtime/dispatcher.h"
#include "common/base58.h"
#include "common/logging.h"
#include <stdexcept>

namespace palisade {
namespace runtime {

const char *dispatch_stage_name(DispatchStage stage) noexcept {
  switch (stage) {
  case DispatchStage::RECEIVED:
    return "Received";
  case DispatchStage::DECODED:
    return "Decoded";
  case DispatchStage::VALIDATED:
    return "Validated";
  case DispatchStage::DISPATCHED:
    return "Dispatched";
  case DispatchStage::SUCCEEDED:
    return "Succeeded";
  case DispatchStage::FAILED:
    return "Failed";
  }
  return "Unknown";
}

Result<DecodedInstruction, ProgramFailure>
decode_instruction(const std::vector<uint8_t> &raw) {
  if (raw.empty()) {
    return make_error(ProgramFailure(ProgramError::EMPTY_INSTRUCTION_DATA));
  }

  DecodedInstruction decoded;
  decoded.discriminant = raw[0];
  decoded.payload = raw.data() + 1;
  decoded.payload_len = raw.size() - 1;
  return Result<DecodedInstruction, ProgramFailure>(decoded);
}

Dispatcher::Dispatcher(const SchemaRegistry &registry, ProgramIds ids,
                       const AddressDeriver &deriver)
    : registry_(registry), ids_(std::move(ids)), pda_(deriver) {
  if (!registry_.is_sealed()) {
    throw std::invalid_argument("dispatcher requires a sealed schema registry");
  }
}

Result<const RegisteredInstruction *, ProgramFailure>
Dispatcher::lookup(uint8_t discriminant) const {
  const RegisteredInstruction *entry = registry_.lookup(discriminant);
  if (!entry) {
    return make_error(ProgramFailure(ProgramError::UNKNOWN_DISCRIMINANT,
                                     registry_.invalid_discriminator_code()));
  }
  return Result<const RegisteredInstruction *, ProgramFailure>(entry);
}

DispatchOutcome Dispatcher::dispatch(const PublicKey &program_id,
                                     const std::vector<AccountHandle> &accounts,
                                     const std::vector<uint8_t> &raw,
                                     HostServices &host) {
  dispatched_.fetch_add(1, std::memory_order_relaxed);

  DispatchOutcome outcome;
  outcome.reached = DispatchStage::RECEIVED;

  if (program_id != ids_.program_id) {
    outcome.failure = ProgramFailure(ProgramError::INCORRECT_PROGRAM_ID);
    return finish(std::move(outcome));
  }

  auto decoded = decode_instruction(raw);
  if (decoded.is_err()) {
    outcome.failure = decoded.error();
    return finish(std::move(outcome));
  }
  const DecodedInstruction &instruction = decoded.value();
  outcome.discriminant = instruction.discriminant;
  outcome.reached = DispatchStage::DECODED;

  auto entry = lookup(instruction.discriminant);
  if (entry.is_err()) {
    outcome.failure = entry.error();
    return finish(std::move(outcome));
  }
  const RegisteredInstruction &registered = *entry.value();
  const InstructionSchema &schema = registered.schema;

  LOG_TRACE("dispatch", "Decoded ", schema.name, " with ", accounts.size(),
            " accounts and ", instruction.payload_len, " payload bytes");

  auto validated = validate_accounts(accounts, schema.accounts, ids_);
  if (validated.is_err()) {
    outcome.failure = validated.error();
    return finish(std::move(outcome));
  }

  if (instruction.payload_len != schema.payload_len()) {
    outcome.failure = ProgramFailure(ProgramError::PAYLOAD_SIZE_MISMATCH);
    return finish(std::move(outcome));
  }
  outcome.reached = DispatchStage::VALIDATED;

  InstructionContext context(
      schema, ids_, std::move(validated).value(),
      Payload(instruction.payload, instruction.payload_len, &schema), pda_,
      host);

  outcome.reached = DispatchStage::DISPATCHED;
  auto result = registered.handler->process(context);
  if (result.is_err()) {
    outcome.failure = result.error();
  }
  return finish(std::move(outcome));
}

DispatchOutcome Dispatcher::finish(DispatchOutcome outcome) {
  if (!outcome.failure) {
    outcome.status = DispatchStage::SUCCEEDED;
    succeeded_.fetch_add(1, std::memory_order_relaxed);
    return outcome;
  }

  outcome.status = DispatchStage::FAILED;
  failed_.fetch_add(1, std::memory_order_relaxed);

  if (Logger::instance().is_enabled(LogLevel::WARN)) {
    const ProgramFailure &failure = *outcome.failure;
    std::unordered_map<std::string, std::string> context{
        {"stage", dispatch_stage_name(outcome.reached)},
        {"program", base58::encode(ids_.program_id)},
        {"code", std::to_string(failure.code())}};
    if (outcome.discriminant) {
      context["discriminant"] = std::to_string(*outcome.discriminant);
    }
    if (failure.account_index) {
      context["account_index"] = std::to_string(*failure.account_index);
    }
    LOG_STRUCTURED(LogLevel::WARN, "dispatch", registry_.describe(failure),
                   error_name(failure.error), context);
  }
  return outcome;
}

Dispatcher::Stats Dispatcher::get_stats() const {
  Stats stats;
  stats.dispatched = dispatched_.load(std::memory_order_relaxed);
  stats.succeeded = succeeded_.load(std::memory_order_relaxed);
  stats.failed = failed_.load(std::memory_order_relaxed);
  return stats;
}

void Dispatcher::reset_stats() {
  dispatched_.store(0, std::memory_order_relaxed);
  succeeded_.store(0, std::memory_order_relaxed);
  failed_.store(0, std::memory_order_relaxed);
}

} // namespace runtime
} // namespace palisade
