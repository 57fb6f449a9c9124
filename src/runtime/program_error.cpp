#include "runtime/program_error.h"
#include <sstream>

namespace palisade {
namespace runtime {

namespace {

constexpr uint64_t builtin(BuiltinError error) {
  return static_cast<uint64_t>(error) << 32;
}

} // namespace

ErrorCategory category_of(ProgramError error) noexcept {
  switch (error) {
  case ProgramError::NOT_SIGNER:
  case ProgramError::NOT_OWNED_BY_PROGRAM:
  case ProgramError::NOT_TOKEN_ACCOUNT:
  case ProgramError::UNEXPECTED_TOKEN_ACCOUNT:
  case ProgramError::ALREADY_INITIALIZED:
  case ProgramError::NOT_WRITABLE:
    return ErrorCategory::ACCOUNT_VALIDATION;
  case ProgramError::NOT_ENOUGH_ACCOUNT_KEYS:
  case ProgramError::EMPTY_INSTRUCTION_DATA:
  case ProgramError::UNKNOWN_DISCRIMINANT:
  case ProgramError::PAYLOAD_SIZE_MISMATCH:
  case ProgramError::SIZE_MISMATCH:
  case ProgramError::INCORRECT_PROGRAM_ID:
    return ErrorCategory::STRUCTURAL;
  case ProgramError::PDA_MISMATCH:
  case ProgramError::MAX_SEED_LENGTH_EXCEEDED:
  case ProgramError::INVALID_SEEDS:
    return ErrorCategory::PDA;
  case ProgramError::INSUFFICIENT_FUNDS:
  case ProgramError::ARITHMETIC_OVERFLOW:
    return ErrorCategory::RUNTIME;
  case ProgramError::CUSTOM:
    return ErrorCategory::CUSTOM;
  }
  return ErrorCategory::CUSTOM;
}

const char *error_name(ProgramError error) noexcept {
  switch (error) {
  case ProgramError::NOT_SIGNER:
    return "NotSigner";
  case ProgramError::NOT_OWNED_BY_PROGRAM:
    return "NotOwnedByProgram";
  case ProgramError::NOT_TOKEN_ACCOUNT:
    return "NotTokenAccount";
  case ProgramError::UNEXPECTED_TOKEN_ACCOUNT:
    return "UnexpectedTokenAccount";
  case ProgramError::ALREADY_INITIALIZED:
    return "AlreadyInitialized";
  case ProgramError::NOT_WRITABLE:
    return "NotWritable";
  case ProgramError::NOT_ENOUGH_ACCOUNT_KEYS:
    return "NotEnoughAccountKeys";
  case ProgramError::EMPTY_INSTRUCTION_DATA:
    return "EmptyInstructionData";
  case ProgramError::UNKNOWN_DISCRIMINANT:
    return "UnknownDiscriminant";
  case ProgramError::PAYLOAD_SIZE_MISMATCH:
    return "PayloadSizeMismatch";
  case ProgramError::SIZE_MISMATCH:
    return "SizeMismatch";
  case ProgramError::INCORRECT_PROGRAM_ID:
    return "IncorrectProgramId";
  case ProgramError::PDA_MISMATCH:
    return "PdaMismatch";
  case ProgramError::MAX_SEED_LENGTH_EXCEEDED:
    return "MaxSeedLengthExceeded";
  case ProgramError::INVALID_SEEDS:
    return "InvalidSeeds";
  case ProgramError::INSUFFICIENT_FUNDS:
    return "InsufficientFunds";
  case ProgramError::ARITHMETIC_OVERFLOW:
    return "ArithmeticOverflow";
  case ProgramError::CUSTOM:
    return "Custom";
  }
  return "Unknown";
}

const char *category_name(ErrorCategory category) noexcept {
  switch (category) {
  case ErrorCategory::ACCOUNT_VALIDATION:
    return "AccountValidation";
  case ErrorCategory::STRUCTURAL:
    return "StructuralError";
  case ErrorCategory::PDA:
    return "PdaError";
  case ErrorCategory::RUNTIME:
    return "RuntimeError";
  case ErrorCategory::CUSTOM:
    return "Custom";
  }
  return "Unknown";
}

uint64_t ProgramFailure::code() const noexcept {
  switch (error) {
  case ProgramError::NOT_SIGNER:
    return builtin(BuiltinError::MISSING_REQUIRED_SIGNATURE);
  case ProgramError::NOT_OWNED_BY_PROGRAM:
  case ProgramError::NOT_TOKEN_ACCOUNT:
  case ProgramError::UNEXPECTED_TOKEN_ACCOUNT:
    return builtin(BuiltinError::INVALID_ACCOUNT_OWNER);
  case ProgramError::ALREADY_INITIALIZED:
    return builtin(BuiltinError::ACCOUNT_ALREADY_INITIALIZED);
  case ProgramError::NOT_WRITABLE:
    return builtin(BuiltinError::INVALID_ACCOUNT_DATA);
  case ProgramError::NOT_ENOUGH_ACCOUNT_KEYS:
    return builtin(BuiltinError::NOT_ENOUGH_ACCOUNT_KEYS);
  case ProgramError::EMPTY_INSTRUCTION_DATA:
  case ProgramError::PAYLOAD_SIZE_MISMATCH:
    return builtin(BuiltinError::INVALID_INSTRUCTION_DATA);
  case ProgramError::SIZE_MISMATCH:
    return builtin(BuiltinError::ACCOUNT_DATA_TOO_SMALL);
  case ProgramError::INCORRECT_PROGRAM_ID:
    return builtin(BuiltinError::INCORRECT_PROGRAM_ID);
  case ProgramError::MAX_SEED_LENGTH_EXCEEDED:
    return builtin(BuiltinError::MAX_SEED_LENGTH_EXCEEDED);
  case ProgramError::INVALID_SEEDS:
    return builtin(BuiltinError::INVALID_SEEDS);
  case ProgramError::INSUFFICIENT_FUNDS:
    return builtin(BuiltinError::INSUFFICIENT_FUNDS);
  case ProgramError::ARITHMETIC_OVERFLOW:
    return builtin(BuiltinError::ARITHMETIC_OVERFLOW);
  case ProgramError::UNKNOWN_DISCRIMINANT:
  case ProgramError::PDA_MISMATCH:
  case ProgramError::CUSTOM:
    return custom_code;
  }
  return custom_code;
}

std::string ProgramFailure::to_string() const {
  std::ostringstream oss;
  oss << category_name(category()) << "::" << error_name(error);
  if (error == ProgramError::PDA_MISMATCH || error == ProgramError::CUSTOM ||
      error == ProgramError::UNKNOWN_DISCRIMINANT) {
    oss << "(" << custom_code << ")";
  }
  if (account_index) {
    oss << " at account " << *account_index;
  }
  return oss.str();
}

} // namespace runtime
} // namespace palisade
