#include "runtime/instruction.h"
#include "common/logging.h"

namespace palisade {
namespace runtime {

size_t InstructionSchema::payload_len() const {
  size_t total = 0;
  for (const auto &f : payload) {
    total += f.size;
  }
  return total;
}

std::optional<size_t>
InstructionSchema::field_offset(const std::string &field_name) const {
  size_t offset = 0;
  for (const auto &f : payload) {
    if (f.name == field_name) {
      return offset;
    }
    offset += f.size;
  }
  return std::nullopt;
}

const PayloadField *
InstructionSchema::field(const std::string &field_name) const {
  for (const auto &f : payload) {
    if (f.name == field_name) {
      return &f;
    }
  }
  return nullptr;
}

Result<AccountHandle, ProgramFailure>
InstructionContext::account(const std::string &name) const {
  auto handle = accounts_.get(name);
  if (!handle) {
    LOG_WARN("dispatch", "Instruction ", schema_.name,
             " declares no account named ", name);
    return make_error(ProgramFailure(ProgramError::NOT_ENOUGH_ACCOUNT_KEYS));
  }
  return Result<AccountHandle, ProgramFailure>(*handle);
}

} // namespace runtime
} // namespace palisade
