#pragma once

#include "common/types.h"
#include <optional>
#include <string>

namespace palisade {
namespace common {
namespace base58 {

/**
 * Encode bytes with the Bitcoin/Solana base58 alphabet.
 * Leading zero bytes become leading '1' characters.
 */
std::string encode(const std::vector<uint8_t> &data);

/**
 * Decode a base58 string.
 * @return std::nullopt if the string contains a character outside the alphabet
 */
std::optional<std::vector<uint8_t>> decode(const std::string &encoded);

/**
 * Decode a base58 account address, requiring exactly 32 bytes.
 */
std::optional<PublicKey> decode_pubkey(const std::string &encoded);

} // namespace base58
} // namespace common
} // namespace palisade
