#pragma once

#include "runtime/instruction.h"
#include "runtime/state_codec.h"
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace palisade {
namespace runtime {

/**
 * Reasons a registration is refused
 */
enum class RegistryError {
    DUPLICATE_DISCRIMINANT,
    DUPLICATE_ACCOUNT_NAME,
    INVALID_PAYLOAD_FIELD,
    NULL_HANDLER,
    INVALID_LAYOUT,
    DUPLICATE_LAYOUT,
    DUPLICATE_ERROR_CODE,
    RESERVED_ERROR_CODE,
    REGISTRY_SEALED
};

const char* registry_error_name(RegistryError error) noexcept;

/**
 * Entry of the program's custom error table
 */
struct ErrorDefinition {
    uint32_t code = 0;
    std::string name;
    std::string message;
};

/**
 * Schema and handler stored for one discriminant
 */
struct RegisteredInstruction {
    InstructionSchema schema;
    std::unique_ptr<InstructionHandler> handler;
};

/**
 * @brief Process-wide table of instructions, layouts and error codes
 *
 * Populated once at startup, then sealed. After seal() every registration
 * fails with REGISTRY_SEALED and the registry is only read, so a sealed
 * registry can be shared between dispatchers without locking.
 *
 * Lookup by discriminant is a direct index into a 256-entry table.
 */
class SchemaRegistry {
public:
    explicit SchemaRegistry(uint32_t invalid_discriminator_code = 6001);
    ~SchemaRegistry() = default;

    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    /**
     * Register an instruction.
     * Rejects a taken discriminant, repeated account names, zero-sized or
     * repeated payload fields, and a null handler.
     */
    Result<bool, RegistryError> register_instruction(
        InstructionSchema schema, std::unique_ptr<InstructionHandler> handler);

    /// Register a state layout; it must be contiguous and its name unused
    Result<bool, RegistryError> register_layout(LayoutDescriptor layout);

    /// Convenience for a compiled layout type exposing a static descriptor()
    template <typename T>
    Result<bool, RegistryError> register_layout() {
        check_layout<T>();
        return register_layout(T::descriptor());
    }

    /**
     * Add a custom program error. The invalid-discriminator code is reserved
     * and codes must be unique.
     */
    Result<bool, RegistryError> register_error(uint32_t code, std::string name,
                                               std::string message);

    void seal() noexcept { sealed_ = true; }
    bool is_sealed() const noexcept { return sealed_; }

    /// nullptr when nothing is registered under discriminant
    const RegisteredInstruction* lookup(uint8_t discriminant) const noexcept {
        return table_[discriminant].get();
    }

    /// Registered schemas ordered by discriminant
    std::vector<const InstructionSchema*> instructions() const;

    const std::vector<LayoutDescriptor>& layouts() const noexcept { return layouts_; }
    const LayoutDescriptor* layout(const std::string& name) const;

    const std::vector<ErrorDefinition>& errors() const noexcept { return errors_; }
    const ErrorDefinition* find_error(uint32_t code) const;

    uint32_t invalid_discriminator_code() const noexcept {
        return invalid_discriminator_code_;
    }

    /**
     * Readable name for a failure: custom codes are resolved through the
     * error table, builtin kinds through their category and name.
     */
    std::string describe(const ProgramFailure& failure) const;

private:
    uint32_t invalid_discriminator_code_;
    bool sealed_ = false;
    std::array<std::unique_ptr<RegisteredInstruction>, 256> table_;
    std::vector<LayoutDescriptor> layouts_;
    std::vector<ErrorDefinition> errors_;
};

} // namespace runtime
} // namespace palisade
