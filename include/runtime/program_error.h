#pragma once

#include "common/types.h"
#include <optional>
#include <string>

namespace palisade {
namespace runtime {

using namespace palisade::common;

/**
 * Error families surfaced at the dispatch boundary
 */
enum class ErrorCategory {
    ACCOUNT_VALIDATION,
    STRUCTURAL,
    PDA,
    RUNTIME,
    CUSTOM
};

/**
 * Every failure the core can report.
 * Any of them aborts the instruction; the host rolls back state.
 */
enum class ProgramError : uint8_t {
    // Account validation
    NOT_SIGNER,
    NOT_OWNED_BY_PROGRAM,
    NOT_TOKEN_ACCOUNT,
    UNEXPECTED_TOKEN_ACCOUNT,
    ALREADY_INITIALIZED,
    NOT_WRITABLE,

    // Structural
    NOT_ENOUGH_ACCOUNT_KEYS,
    EMPTY_INSTRUCTION_DATA,
    UNKNOWN_DISCRIMINANT,
    PAYLOAD_SIZE_MISMATCH,
    SIZE_MISMATCH,
    INCORRECT_PROGRAM_ID,

    // Program derived addresses
    PDA_MISMATCH,
    MAX_SEED_LENGTH_EXCEEDED,
    INVALID_SEEDS,

    // Host collaborators
    INSUFFICIENT_FUNDS,
    ARITHMETIC_OVERFLOW,

    // Handler defined, see ProgramFailure::custom_code
    CUSTOM
};

/**
 * Builtin error numbering of the VM. Encoded as (index << 32) in the
 * returned 64-bit code; custom codes occupy the low 32 bits only.
 */
enum class BuiltinError : uint64_t {
    INVALID_ARGUMENT = 2,
    INVALID_INSTRUCTION_DATA = 3,
    INVALID_ACCOUNT_DATA = 4,
    ACCOUNT_DATA_TOO_SMALL = 5,
    INSUFFICIENT_FUNDS = 6,
    INCORRECT_PROGRAM_ID = 7,
    MISSING_REQUIRED_SIGNATURE = 8,
    ACCOUNT_ALREADY_INITIALIZED = 9,
    UNINITIALIZED_ACCOUNT = 10,
    NOT_ENOUGH_ACCOUNT_KEYS = 11,
    MAX_SEED_LENGTH_EXCEEDED = 13,
    INVALID_SEEDS = 14,
    INVALID_ACCOUNT_OWNER = 23,
    ARITHMETIC_OVERFLOW = 24
};

ErrorCategory category_of(ProgramError error) noexcept;
const char* error_name(ProgramError error) noexcept;
const char* category_name(ErrorCategory category) noexcept;

/**
 * A tagged failure as it leaves the core.
 *
 * account_index is set for account validation failures and names the first
 * failing position. custom_code is meaningful for PDA_MISMATCH, CUSTOM and
 * UNKNOWN_DISCRIMINANT.
 */
struct ProgramFailure {
    ProgramError error = ProgramError::CUSTOM;
    uint32_t custom_code = 0;
    std::optional<size_t> account_index;

    ProgramFailure() = default;
    explicit ProgramFailure(ProgramError e) : error(e) {}
    ProgramFailure(ProgramError e, uint32_t code) : error(e), custom_code(code) {}

    static ProgramFailure at_account(ProgramError e, size_t index) {
        ProgramFailure failure(e);
        failure.account_index = index;
        return failure;
    }

    static ProgramFailure custom(uint32_t code) {
        return ProgramFailure(ProgramError::CUSTOM, code);
    }

    ErrorCategory category() const noexcept { return category_of(error); }

    /// The numeric code returned to the host
    uint64_t code() const noexcept;

    std::string to_string() const;

    bool operator==(const ProgramFailure& other) const {
        return error == other.error && custom_code == other.custom_code &&
               account_index == other.account_index;
    }
    bool operator!=(const ProgramFailure& other) const { return !(*this == other); }
};

/// Outcome of any step on the instruction path
using ProgramResult = Result<bool, ProgramFailure>;

inline ProgramResult success() { return ProgramResult(true); }

inline ProgramResult fail(ProgramFailure failure) {
    return ProgramResult(make_error(std::move(failure)));
}

inline ProgramResult fail(ProgramError error) {
    return fail(ProgramFailure(error));
}

/// Shorthand for handlers returning one of their registered error codes
inline ProgramResult fail_custom(uint32_t code) {
    return fail(ProgramFailure::custom(code));
}

} // namespace runtime
} // namespace palisade
