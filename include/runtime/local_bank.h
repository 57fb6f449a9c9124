#pragma once

#include "runtime/dispatcher.h"
#include "runtime/host.h"
#include "runtime/rent_calculator.h"
#include <optional>
#include <unordered_map>
#include <vector>

namespace palisade {
namespace runtime {

/**
 * One account position of an instruction as the caller lists it
 */
struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta signer(const PublicKey& key, bool writable = false) {
        return AccountMeta{key, true, writable};
    }
    static AccountMeta writable(const PublicKey& key) {
        return AccountMeta{key, false, true};
    }
    static AccountMeta readonly(const PublicKey& key) {
        return AccountMeta{key, false, false};
    }
};

/**
 * @brief In-memory host for running a program outside the VM
 *
 * Holds an account store and implements HostServices over it. Each invoke()
 * runs on working copies of the touched accounts and commits them only when
 * the instruction succeeds, so a failed instruction leaves the store exactly
 * as it was.
 *
 * Not thread-safe; one invocation at a time.
 */
class LocalBank : public HostServices {
public:
    explicit LocalBank(const RuntimeConfig& config);
    LocalBank(RentCalculator rent, PublicKey system_program_id);
    ~LocalBank() override = default;

    /// Insert or replace a stored account
    void set_account(const PublicKey& key, Lamports lamports, const PublicKey& owner,
                     std::vector<uint8_t> data = {}, bool executable = false);

    std::optional<AccountInfo> get_account(const PublicKey& key) const;
    bool has_account(const PublicKey& key) const;
    size_t account_count() const noexcept { return accounts_.size(); }

    void set_clock(const Clock& clock) noexcept { clock_ = clock; }

    /**
     * Run one instruction against the store.
     *
     * Duplicate keys in metas share one record, with signer and writable
     * flags merged. Keys the store does not know start as empty
     * system-owned accounts. On success, changes are committed and
     * zero-lamport accounts are dropped; a successful instruction that
     * modified a read-only account is turned into a NOT_WRITABLE failure.
     */
    DispatchOutcome invoke(Dispatcher& dispatcher, const std::vector<AccountMeta>& metas,
                           const std::vector<uint8_t>& raw);

    /// As above, presenting an explicit program id to the dispatcher
    DispatchOutcome invoke(Dispatcher& dispatcher, const PublicKey& program_id,
                           const std::vector<AccountMeta>& metas,
                           const std::vector<uint8_t>& raw);

    // HostServices
    const RentCalculator& rent() const override { return rent_; }
    Clock clock() const override { return clock_; }

    ProgramResult transfer_lamports(const AccountHandle& from, const AccountHandle& to,
                                    Lamports amount) override;

    ProgramResult create_pda_account(const AccountHandle& payer, const AccountHandle& target,
                                     size_t space, const PublicKey& owner,
                                     const Seeds& signer_seeds) override;

private:
    bool authorized_by_seeds(const AccountHandle& target, const Seeds& signer_seeds) const;

    std::unordered_map<PublicKey, AccountInfo> accounts_;
    RentCalculator rent_;
    PublicKey system_program_id_;
    Clock clock_;

    // Set for the duration of invoke()
    const Dispatcher* active_ = nullptr;
};

} // namespace runtime
} // namespace palisade
