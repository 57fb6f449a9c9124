#include "runtime/pda.h"
#include "common/logging.h"
#include <cstring>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sodium.h>
#include <stdexcept>

namespace palisade {
namespace runtime {

const char PDA_MARKER[] = "ProgramDerivedAddress";

Seed seed_bytes(const std::string &text) {
  return Seed(text.begin(), text.end());
}

Seeds with_bump(const Seeds &seeds, uint8_t bump) {
  Seeds result = seeds;
  result.push_back(Seed{bump});
  return result;
}

ProgramResult check_seeds(const Seeds &seeds) {
  if (seeds.size() >= MAX_SEEDS) {
    return fail(ProgramError::MAX_SEED_LENGTH_EXCEEDED);
  }
  for (const auto &seed : seeds) {
    if (seed.size() > MAX_SEED_LEN) {
      return fail(ProgramError::MAX_SEED_LENGTH_EXCEEDED);
    }
  }
  return success();
}

// Sha256AddressDeriver implementation

Sha256AddressDeriver::Sha256AddressDeriver() {
  if (sodium_init() < 0) {
    throw std::runtime_error("libsodium initialization failed");
  }
}

std::optional<PublicKey>
Sha256AddressDeriver::hash_address(const Seeds &seeds, uint8_t bump,
                                   const PublicKey &program_id) const {
  PublicKey address(SHA256_DIGEST_LENGTH, 0);

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    LOG_ERROR("pda", "EVP_MD_CTX_new failed");
    return std::nullopt;
  }

  bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
  for (const auto &seed : seeds) {
    if (ok && !seed.empty()) {
      ok = EVP_DigestUpdate(ctx, seed.data(), seed.size()) == 1;
    }
  }
  ok = ok && EVP_DigestUpdate(ctx, &bump, 1) == 1;
  ok = ok && EVP_DigestUpdate(ctx, program_id.data(), program_id.size()) == 1;
  ok = ok && EVP_DigestUpdate(ctx, PDA_MARKER, std::strlen(PDA_MARKER)) == 1;

  unsigned int len = SHA256_DIGEST_LENGTH;
  ok = ok && EVP_DigestFinal_ex(ctx, address.data(), &len) == 1;
  EVP_MD_CTX_free(ctx);

  if (!ok) {
    LOG_ERROR("pda", "SHA-256 digest failed");
    return std::nullopt;
  }
  return address;
}

bool Sha256AddressDeriver::is_on_curve(const PublicKey &address) const {
  if (address.size() != crypto_core_ed25519_BYTES) {
    return false;
  }
  return crypto_core_ed25519_is_valid_point(address.data()) == 1;
}

std::optional<DerivedAddress>
Sha256AddressDeriver::find_program_address(const Seeds &seeds,
                                           const PublicKey &program_id) const {
  for (int bump = 255; bump >= 0; --bump) {
    auto candidate =
        hash_address(seeds, static_cast<uint8_t>(bump), program_id);
    if (!candidate) {
      return std::nullopt;
    }
    if (!is_on_curve(*candidate)) {
      return DerivedAddress{*candidate, static_cast<uint8_t>(bump)};
    }
  }
  return std::nullopt;
}

// PdaVerifier implementation

Result<DerivedAddress, ProgramFailure>
PdaVerifier::derive(const Seeds &seeds, const PublicKey &program_id) const {
  auto seeds_ok = check_seeds(seeds);
  if (seeds_ok.is_err()) {
    return make_error(seeds_ok.error());
  }

  auto found = deriver_.find_program_address(seeds, program_id);
  if (!found) {
    LOG_WARN("pda", "No viable bump for ", seeds.size(), " seeds");
    return make_error(ProgramFailure(ProgramError::INVALID_SEEDS));
  }

  LOG_TRACE("pda", "Derived address with bump ", static_cast<int>(found->bump));
  return Result<DerivedAddress, ProgramFailure>(*found);
}

Result<PublicKey, ProgramFailure>
PdaVerifier::create_program_address(const Seeds &seeds, uint8_t bump,
                                    const PublicKey &program_id) const {
  auto seeds_ok = check_seeds(seeds);
  if (seeds_ok.is_err()) {
    return make_error(seeds_ok.error());
  }

  auto address = deriver_.hash_address(seeds, bump, program_id);
  if (!address || deriver_.is_on_curve(*address)) {
    return make_error(ProgramFailure(ProgramError::INVALID_SEEDS));
  }
  return Result<PublicKey, ProgramFailure>(*address);
}

bool PdaVerifier::verify_with_known_bump(const PublicKey &key,
                                         const Seeds &seeds, uint8_t bump,
                                         const PublicKey &program_id) const {
  if (check_seeds(seeds).is_err()) {
    return false;
  }
  auto address = deriver_.hash_address(seeds, bump, program_id);
  return address && *address == key;
}

ProgramResult PdaVerifier::assert_pda(const AccountHandle &account,
                                      const Seeds &seeds, uint8_t bump,
                                      const PublicKey &program_id,
                                      uint32_t error_code) const {
  if (!verify_with_known_bump(account.key(), seeds, bump, program_id)) {
    return fail(ProgramFailure(ProgramError::PDA_MISMATCH, error_code));
  }
  return success();
}

ProgramResult PdaVerifier::validate_pdas(const std::vector<PdaCheck> &checks,
                                         const PublicKey &program_id) const {
  for (const auto &check : checks) {
    auto result = assert_pda(check.account, check.seeds, check.bump,
                             program_id, check.error_code);
    if (result.is_err()) {
      return result;
    }
  }
  return success();
}

} // namespace runtime
} // namespace palisade
