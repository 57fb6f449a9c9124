#pragma once

#include "common/config.h"
#include "common/types.h"
#include "runtime/program_error.h"
#include <vector>

namespace palisade {
namespace runtime {

using namespace palisade::common;

/// Marker written to byte 0 of a closed account
constexpr uint8_t CLOSED_ACCOUNT_MARKER = 0xFF;

/**
 * Account record owned by the host for the duration of an invocation
 */
struct AccountInfo {
    PublicKey pubkey;
    PublicKey owner;
    Lamports lamports = 0;
    std::vector<uint8_t> data;
    bool is_signer = false;
    bool is_writable = false;
    bool executable = false;
    Epoch rent_epoch = 0;

    AccountInfo() = default;
    AccountInfo(const AccountInfo&) = default;
    AccountInfo(AccountInfo&&) = default;
    AccountInfo& operator=(const AccountInfo&) = default;
    AccountInfo& operator=(AccountInfo&&) = default;
};

/**
 * Borrowed view of one AccountInfo.
 *
 * Handles are cheap to copy. They never own the record: the host keeps the
 * AccountInfo alive for the whole invocation. Two handles over the same
 * record see the same lamports and data buffer.
 */
class AccountHandle {
public:
    AccountHandle() = default;
    explicit AccountHandle(AccountInfo* info) : info_(info) {}

    bool is_valid() const noexcept { return info_ != nullptr; }

    const PublicKey& key() const { return info_->pubkey; }
    const PublicKey& owner() const { return info_->owner; }
    bool is_signer() const { return info_->is_signer; }
    bool is_writable() const { return info_->is_writable; }
    bool executable() const { return info_->executable; }
    Lamports lamports() const { return info_->lamports; }

    uint8_t* data() const { return info_->data.data(); }
    size_t data_len() const { return info_->data.size(); }

    bool is_owned_by(const PublicKey& program_id) const {
        return info_->owner == program_id;
    }

    /// True when both handles view the same host record
    bool aliases(const AccountHandle& other) const noexcept {
        return info_ == other.info_;
    }

    void set_lamports(Lamports lamports) const { info_->lamports = lamports; }
    void assign_owner(const PublicKey& owner) const { info_->owner = owner; }

    AccountInfo* info() const noexcept { return info_; }

private:
    AccountInfo* info_ = nullptr;
};

/// Build handles over a host-owned account list, preserving order
std::vector<AccountHandle> make_handles(std::vector<AccountInfo>& accounts);

/**
 * Well-known program identities an invocation is checked against
 */
struct ProgramIds {
    PublicKey program_id;
    PublicKey system_program_id;
    PublicKey token_program_id;

    static ProgramIds from_config(const RuntimeConfig& config);
};

/**
 * Close a program-owned account.
 *
 * Moves every lamport to receiver, writes CLOSED_ACCOUNT_MARKER into the
 * first data byte and hands the account back to the system program. Both
 * accounts must be writable.
 */
ProgramResult close_account(const AccountHandle& account,
                            const AccountHandle& receiver,
                            const PublicKey& system_program_id);

} // namespace runtime
} // namespace palisade
