#pragma once

#include "runtime/account.h"
#include "runtime/program_error.h"
#include <optional>
#include <string>
#include <vector>

namespace palisade {
namespace runtime {

using Seed = std::vector<uint8_t>;
using Seeds = std::vector<Seed>;

/// Seed slots per address, the bump included
constexpr size_t MAX_SEEDS = 16;

/// Bytes per seed
constexpr size_t MAX_SEED_LEN = 32;

/// Domain separator appended after the program id
extern const char PDA_MARKER[];

/// Seed from a string literal such as "counter"
Seed seed_bytes(const std::string& text);

/// Copy of seeds with the bump appended as a final one-byte seed
Seeds with_bump(const Seeds& seeds, uint8_t bump);

/**
 * Check caller seeds leave room for the bump: at most MAX_SEEDS - 1 seeds of
 * at most MAX_SEED_LEN bytes each.
 */
ProgramResult check_seeds(const Seeds& seeds);

struct DerivedAddress {
    PublicKey address;
    uint8_t bump = 0;
};

/**
 * Address-derivation primitive provided by the host.
 *
 * hash_address() is one hash with no curve test; std::nullopt means the
 * digest backend failed. find_program_address() probes bumps from 255
 * downward until hash_address() falls off the curve.
 * Callers are expected to have checked seed limits.
 */
class AddressDeriver {
public:
    virtual ~AddressDeriver() = default;

    virtual std::optional<PublicKey> hash_address(const Seeds& seeds, uint8_t bump,
                                                  const PublicKey& program_id) const = 0;

    virtual bool is_on_curve(const PublicKey& address) const = 0;

    virtual std::optional<DerivedAddress> find_program_address(
        const Seeds& seeds, const PublicKey& program_id) const = 0;
};

/**
 * Default deriver: SHA-256(seeds ‖ bump ‖ program_id ‖ PDA_MARKER), with
 * the Ed25519 point test from libsodium.
 */
class Sha256AddressDeriver : public AddressDeriver {
public:
    Sha256AddressDeriver();
    ~Sha256AddressDeriver() override = default;

    std::optional<PublicKey> hash_address(const Seeds& seeds, uint8_t bump,
                                          const PublicKey& program_id) const override;

    bool is_on_curve(const PublicKey& address) const override;

    std::optional<DerivedAddress> find_program_address(
        const Seeds& seeds, const PublicKey& program_id) const override;
};

/**
 * One expected PDA in a batch check
 */
struct PdaCheck {
    AccountHandle account;
    Seeds seeds;
    uint8_t bump = 0;
    uint32_t error_code = 0;
};

/**
 * PDA derivation and verification on top of an AddressDeriver.
 *
 * Hot-path checks use a bump persisted in account state and cost a single
 * hash. derive() runs the full bump search and belongs on the account
 * creation path only.
 */
class PdaVerifier {
public:
    explicit PdaVerifier(const AddressDeriver& deriver) : deriver_(deriver) {}

    /// Canonical address and bump for seeds under program_id
    Result<DerivedAddress, ProgramFailure> derive(const Seeds& seeds,
                                                  const PublicKey& program_id) const;

    /// Address for an explicit bump; INVALID_SEEDS if it lands on the curve
    Result<PublicKey, ProgramFailure> create_program_address(
        const Seeds& seeds, uint8_t bump, const PublicKey& program_id) const;

    /// Recompute with the given bump (one hash) and compare against key
    bool verify_with_known_bump(const PublicKey& key, const Seeds& seeds,
                                uint8_t bump, const PublicKey& program_id) const;

    /// Fails PDA_MISMATCH carrying error_code when the account key differs
    ProgramResult assert_pda(const AccountHandle& account, const Seeds& seeds,
                             uint8_t bump, const PublicKey& program_id,
                             uint32_t error_code) const;

    /// assert_pda over a batch, stopping at the first mismatch
    ProgramResult validate_pdas(const std::vector<PdaCheck>& checks,
                                const PublicKey& program_id) const;

    const AddressDeriver& deriver() const noexcept { return deriver_; }

private:
    const AddressDeriver& deriver_;
};

} // namespace runtime
} // namespace palisade
