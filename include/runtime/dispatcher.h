#pragma once

#include "runtime/host.h"
#include "runtime/instruction.h"
#include "runtime/pda.h"
#include "runtime/schema_registry.h"
#include <atomic>
#include <optional>
#include <vector>

namespace palisade {
namespace runtime {

/**
 * Stages of one instruction on its way through the dispatcher
 */
enum class DispatchStage {
    RECEIVED,   // raw bytes accepted from the host
    DECODED,    // discriminant split off from the payload
    VALIDATED,  // accounts and payload length checked
    DISPATCHED, // handler invoked
    SUCCEEDED,
    FAILED
};

const char* dispatch_stage_name(DispatchStage stage) noexcept;

/**
 * Raw instruction split into discriminant and payload. The payload points
 * into the caller's buffer.
 */
struct DecodedInstruction {
    uint8_t discriminant = 0;
    const uint8_t* payload = nullptr;
    size_t payload_len = 0;
};

/// First byte is the discriminant; EMPTY_INSTRUCTION_DATA on empty input
Result<DecodedInstruction, ProgramFailure> decode_instruction(
    const std::vector<uint8_t>& raw);

/**
 * What happened to one instruction.
 *
 * reached is the last non-terminal stage entered: a handler ran exactly
 * when reached == DISPATCHED.
 */
struct DispatchOutcome {
    DispatchStage reached = DispatchStage::RECEIVED;
    DispatchStage status = DispatchStage::FAILED;
    std::optional<uint8_t> discriminant;
    std::optional<ProgramFailure> failure;

    bool is_success() const noexcept { return status == DispatchStage::SUCCEEDED; }
    bool handler_invoked() const noexcept { return reached == DispatchStage::DISPATCHED; }

    /// 0 on success, otherwise the failure's numeric code
    uint64_t error_code() const noexcept { return failure ? failure->code() : 0; }

    ProgramResult result() const {
        return failure ? fail(*failure) : success();
    }
};

/**
 * @brief Decodes instructions and routes them to registered handlers
 *
 * Order of checks for every instruction: program id, decode, lookup, account
 * validation, payload length, handler. The first failure ends the
 * instruction and no handler runs unless every earlier check passed.
 * Dispatch itself never mutates accounts; rollback of handler changes is the
 * host's job.
 */
class Dispatcher {
public:
    /**
     * @throws std::invalid_argument if the registry is not sealed
     */
    Dispatcher(const SchemaRegistry& registry, ProgramIds ids,
               const AddressDeriver& deriver);
    ~Dispatcher() = default;

    DispatchOutcome dispatch(const PublicKey& program_id,
                             const std::vector<AccountHandle>& accounts,
                             const std::vector<uint8_t>& raw,
                             HostServices& host);

    /// UNKNOWN_DISCRIMINANT carrying the registry's invalid-discriminator code
    Result<const RegisteredInstruction*, ProgramFailure> lookup(uint8_t discriminant) const;

    const ProgramIds& ids() const noexcept { return ids_; }
    const SchemaRegistry& registry() const noexcept { return registry_; }
    const PdaVerifier& pda() const noexcept { return pda_; }

    struct Stats {
        uint64_t dispatched = 0;
        uint64_t succeeded = 0;
        uint64_t failed = 0;
    };

    Stats get_stats() const;
    void reset_stats();

private:
    DispatchOutcome finish(DispatchOutcome outcome);

    const SchemaRegistry& registry_;
    ProgramIds ids_;
    PdaVerifier pda_;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace runtime
} // namespace palisade
