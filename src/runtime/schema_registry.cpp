#include "runtime/schema_registry.h"
#include "common/logging.h"
#include <sstream>
#include <unordered_set>

namespace palisade {
namespace runtime {

namespace {

Result<bool, RegistryError> refuse(RegistryError error,
                                   const std::string &subject) {
  std::unordered_map<std::string, std::string> context{{"subject", subject}};
  LOG_REGISTRY_ERROR("Registration refused", registry_error_name(error),
                     context);
  return make_error(error);
}

Result<bool, RegistryError> accepted() {
  return Result<bool, RegistryError>(true);
}

} // namespace

const char *registry_error_name(RegistryError error) noexcept {
  switch (error) {
  case RegistryError::DUPLICATE_DISCRIMINANT:
    return "DuplicateDiscriminant";
  case RegistryError::DUPLICATE_ACCOUNT_NAME:
    return "DuplicateAccountName";
  case RegistryError::INVALID_PAYLOAD_FIELD:
    return "InvalidPayloadField";
  case RegistryError::NULL_HANDLER:
    return "NullHandler";
  case RegistryError::INVALID_LAYOUT:
    return "InvalidLayout";
  case RegistryError::DUPLICATE_LAYOUT:
    return "DuplicateLayout";
  case RegistryError::DUPLICATE_ERROR_CODE:
    return "DuplicateErrorCode";
  case RegistryError::RESERVED_ERROR_CODE:
    return "ReservedErrorCode";
  case RegistryError::REGISTRY_SEALED:
    return "RegistrySealed";
  }
  return "Unknown";
}

SchemaRegistry::SchemaRegistry(uint32_t invalid_discriminator_code)
    : invalid_discriminator_code_(invalid_discriminator_code) {}

Result<bool, RegistryError>
SchemaRegistry::register_instruction(InstructionSchema schema,
                                     std::unique_ptr<InstructionHandler> handler) {
  if (sealed_) {
    return refuse(RegistryError::REGISTRY_SEALED, schema.name);
  }
  if (!handler) {
    return refuse(RegistryError::NULL_HANDLER, schema.name);
  }
  if (table_[schema.discriminant]) {
    return refuse(RegistryError::DUPLICATE_DISCRIMINANT, schema.name);
  }

  std::unordered_set<std::string> names;
  for (const auto &account : schema.accounts) {
    if (!names.insert(account.name).second) {
      return refuse(RegistryError::DUPLICATE_ACCOUNT_NAME,
                    schema.name + "." + account.name);
    }
  }

  std::unordered_set<std::string> fields;
  for (const auto &field : schema.payload) {
    if (field.size == 0 || !fields.insert(field.name).second) {
      return refuse(RegistryError::INVALID_PAYLOAD_FIELD,
                    schema.name + "." + field.name);
    }
  }

  LOG_DEBUG("registry", "Registered instruction ", schema.name,
            " discriminant=", static_cast<int>(schema.discriminant),
            " accounts=", schema.accounts.size(),
            " payload_len=", schema.payload_len());

  uint8_t discriminant = schema.discriminant;
  auto entry = std::make_unique<RegisteredInstruction>();
  entry->schema = std::move(schema);
  entry->handler = std::move(handler);
  table_[discriminant] = std::move(entry);
  return accepted();
}

Result<bool, RegistryError>
SchemaRegistry::register_layout(LayoutDescriptor layout) {
  if (sealed_) {
    return refuse(RegistryError::REGISTRY_SEALED, layout.name);
  }
  if (!is_contiguous(layout)) {
    return refuse(RegistryError::INVALID_LAYOUT, layout.name);
  }
  if (this->layout(layout.name)) {
    return refuse(RegistryError::DUPLICATE_LAYOUT, layout.name);
  }

  LOG_DEBUG("registry", "Registered layout ", layout.name, " len=", layout.len,
            " fields=", layout.fields.size());
  layouts_.push_back(std::move(layout));
  return accepted();
}

Result<bool, RegistryError> SchemaRegistry::register_error(uint32_t code,
                                                           std::string name,
                                                           std::string message) {
  if (sealed_) {
    return refuse(RegistryError::REGISTRY_SEALED, name);
  }
  if (code == invalid_discriminator_code_) {
    return refuse(RegistryError::RESERVED_ERROR_CODE, name);
  }
  if (find_error(code)) {
    return refuse(RegistryError::DUPLICATE_ERROR_CODE, name);
  }

  LOG_DEBUG("registry", "Registered error ", code, " ", name);
  errors_.push_back(ErrorDefinition{code, std::move(name), std::move(message)});
  return accepted();
}

std::vector<const InstructionSchema *> SchemaRegistry::instructions() const {
  std::vector<const InstructionSchema *> result;
  for (const auto &entry : table_) {
    if (entry) {
      result.push_back(&entry->schema);
    }
  }
  return result;
}

const LayoutDescriptor *SchemaRegistry::layout(const std::string &name) const {
  for (const auto &l : layouts_) {
    if (l.name == name) {
      return &l;
    }
  }
  return nullptr;
}

const ErrorDefinition *SchemaRegistry::find_error(uint32_t code) const {
  for (const auto &e : errors_) {
    if (e.code == code) {
      return &e;
    }
  }
  return nullptr;
}

std::string SchemaRegistry::describe(const ProgramFailure &failure) const {
  std::ostringstream oss;

  switch (failure.error) {
  case ProgramError::CUSTOM: {
    const ErrorDefinition *def = find_error(failure.custom_code);
    if (def) {
      oss << def->name << " (" << def->code << "): " << def->message;
    } else {
      oss << "Custom(" << failure.custom_code << ")";
    }
    break;
  }
  case ProgramError::UNKNOWN_DISCRIMINANT:
    oss << "InvalidDiscriminator (" << failure.custom_code << ")";
    break;
  case ProgramError::PDA_MISMATCH: {
    oss << category_name(failure.category()) << "::PdaMismatch";
    const ErrorDefinition *def = find_error(failure.custom_code);
    if (def) {
      oss << " " << def->name;
    }
    oss << " (" << failure.custom_code << ")";
    break;
  }
  default:
    oss << category_name(failure.category()) << "::" << error_name(failure.error);
    break;
  }

  if (failure.account_index) {
    oss << " at account " << *failure.account_index;
  }
  return oss.str();
}

} // namespace runtime
} // namespace palisade
