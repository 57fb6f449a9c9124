#include "runtime/account_validator.h"

namespace palisade {
namespace runtime {

const char *account_kind_name(AccountKind kind) noexcept {
  switch (kind) {
  case AccountKind::SIGNER:
    return "signer";
  case AccountKind::PROGRAM_OWNED:
    return "program";
  case AccountKind::TOKEN_OWNED:
    return "token";
  case AccountKind::NOT_TOKEN_OWNED:
    return "not_token";
  case AccountKind::UNINITIALIZED:
    return "uninitialized";
  case AccountKind::ANY:
    return "any";
  }
  return "any";
}

std::optional<AccountHandle>
ValidatedAccounts::get(const std::string &name) const {
  for (size_t i = 0; i < names_.size() && i < handles_.size(); ++i) {
    if (names_[i] == name) {
      return handles_[i];
    }
  }
  return std::nullopt;
}

std::optional<ProgramError> check_account(const AccountHandle &account,
                                          const AccountConstraintSpec &spec,
                                          const ProgramIds &ids) {
  switch (spec.kind) {
  case AccountKind::SIGNER:
    if (!account.is_signer()) {
      return ProgramError::NOT_SIGNER;
    }
    break;

  case AccountKind::PROGRAM_OWNED:
    // A zero balance means the account was never created
    if (!account.is_owned_by(ids.program_id) || account.lamports() == 0) {
      return ProgramError::NOT_OWNED_BY_PROGRAM;
    }
    break;

  case AccountKind::TOKEN_OWNED:
    if (!account.is_owned_by(ids.token_program_id)) {
      return ProgramError::NOT_TOKEN_ACCOUNT;
    }
    break;

  case AccountKind::NOT_TOKEN_OWNED:
    if (account.is_owned_by(ids.token_program_id)) {
      return ProgramError::UNEXPECTED_TOKEN_ACCOUNT;
    }
    break;

  case AccountKind::UNINITIALIZED:
    if (!account.is_owned_by(ids.system_program_id) ||
        account.lamports() != 0) {
      return ProgramError::ALREADY_INITIALIZED;
    }
    break;

  case AccountKind::ANY:
    break;
  }

  if (spec.requires_writable() && !account.is_writable()) {
    return ProgramError::NOT_WRITABLE;
  }

  return std::nullopt;
}

Result<ValidatedAccounts, ProgramFailure>
validate_accounts(const std::vector<AccountHandle> &accounts,
                  const std::vector<AccountConstraintSpec> &specs,
                  const ProgramIds &ids) {
  if (accounts.size() < specs.size()) {
    return make_error(ProgramFailure(ProgramError::NOT_ENOUGH_ACCOUNT_KEYS));
  }

  for (size_t i = 0; i < specs.size(); ++i) {
    auto error = check_account(accounts[i], specs[i], ids);
    if (error) {
      return make_error(ProgramFailure::at_account(*error, i));
    }
  }

  std::vector<AccountHandle> bound(accounts.begin(),
                                   accounts.begin() + specs.size());
  std::vector<std::string> names;
  names.reserve(specs.size());
  for (const auto &spec : specs) {
    names.push_back(spec.name);
  }
  return Result<ValidatedAccounts, ProgramFailure>(
      ValidatedAccounts(std::move(bound), std::move(names)));
}

} // namespace runtime
} // namespace palisade
