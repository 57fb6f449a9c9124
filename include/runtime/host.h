#pragma once

#include "runtime/account.h"
#include "runtime/pda.h"
#include "runtime/program_error.h"
#include "runtime/rent_calculator.h"

namespace palisade {
namespace runtime {

/**
 * Clock oracle reading for the current invocation
 */
struct Clock {
    Slot slot = 0;
    Epoch epoch = 0;
    UnixTimestamp unix_timestamp = 0;
};

/**
 * Services the surrounding VM provides to instruction handlers.
 *
 * The host also owns rollback: when an instruction fails, every change made
 * through these calls or through account views is discarded.
 */
class HostServices {
public:
    virtual ~HostServices() = default;

    virtual const RentCalculator& rent() const = 0;

    virtual Clock clock() const = 0;

    /**
     * Move lamports between two writable accounts. The source must have
     * signed or be owned by the invoking program.
     */
    virtual ProgramResult transfer_lamports(const AccountHandle& from,
                                            const AccountHandle& to,
                                            Lamports amount) = 0;

    /**
     * Create target as a rent-exempt account of `space` zeroed bytes owned by
     * `owner`, funded by payer. signer_seeds (bump last) must derive target
     * under the invoking program unless target itself signed.
     */
    virtual ProgramResult create_pda_account(const AccountHandle& payer,
                                             const AccountHandle& target,
                                             size_t space,
                                             const PublicKey& owner,
                                             const Seeds& signer_seeds) = 0;
};

} // namespace runtime
} // namespace palisade
