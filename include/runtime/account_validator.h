#pragma once

#include "runtime/account.h"
#include "runtime/program_error.h"
#include <optional>
#include <string>
#include <vector>

namespace palisade {
namespace runtime {

/**
 * Declared role of an account position
 */
enum class AccountKind {
    SIGNER,          // must have signed the invocation
    PROGRAM_OWNED,   // owned by this program and funded
    TOKEN_OWNED,     // owned by the token program
    NOT_TOKEN_OWNED, // anything but the token program
    UNINITIALIZED,   // system owned, zero lamports, about to be created
    ANY
};

const char* account_kind_name(AccountKind kind) noexcept;

/**
 * Constraint declared for one account position of an instruction
 */
struct AccountConstraintSpec {
    std::string name;
    AccountKind kind = AccountKind::ANY;
    bool writable = false;
    std::string description;

    /// Uninitialized accounts are about to be created, so they are always mutable
    bool requires_writable() const noexcept {
        return writable || kind == AccountKind::UNINITIALIZED;
    }
};

/**
 * Accounts that passed validation, in input order.
 *
 * Positions beyond the declared specs are not part of the bindings. The
 * declared names are copied, so the bindings outlive the spec list they were
 * checked against.
 */
class ValidatedAccounts {
public:
    ValidatedAccounts() = default;
    ValidatedAccounts(std::vector<AccountHandle> handles, std::vector<std::string> names)
        : handles_(std::move(handles)), names_(std::move(names)) {}

    size_t size() const noexcept { return handles_.size(); }
    const AccountHandle& operator[](size_t index) const { return handles_[index]; }
    const AccountHandle& at(size_t index) const { return handles_.at(index); }

    /// Look up a binding by its declared name
    std::optional<AccountHandle> get(const std::string& name) const;

    const std::vector<AccountHandle>& handles() const noexcept { return handles_; }
    const std::vector<std::string>& names() const noexcept { return names_; }

private:
    std::vector<AccountHandle> handles_;
    std::vector<std::string> names_;
};

/**
 * Check one account against its spec.
 * @return the failing error kind, or std::nullopt when the account satisfies the spec
 */
std::optional<ProgramError> check_account(const AccountHandle& account,
                                          const AccountConstraintSpec& spec,
                                          const ProgramIds& ids);

/**
 * Validate an account list against declared constraints.
 *
 * Fails NOT_ENOUGH_ACCOUNT_KEYS before looking at any position when the list
 * is shorter than the specs. Otherwise stops at the first failing position and
 * reports its index. Trailing extra accounts are ignored. No side effects.
 */
Result<ValidatedAccounts, ProgramFailure> validate_accounts(
    const std::vector<AccountHandle>& accounts,
    const std::vector<AccountConstraintSpec>& specs,
    const ProgramIds& ids);

} // namespace runtime
} // namespace palisade
