#include "common/base58.h"
#include <array>

namespace palisade {
namespace common {
namespace base58 {

namespace {

// Base58 alphabet used by Bitcoin and Solana
const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

const std::array<int, 256> &base58_map() {
  static const std::array<int, 256> map = [] {
    std::array<int, 256> m{};
    m.fill(-1);
    for (int i = 0; i < 58; ++i) {
      m[static_cast<unsigned char>(BASE58_ALPHABET[i])] = i;
    }
    return m;
  }();
  return map;
}

} // namespace

std::string encode(const std::vector<uint8_t> &data) {
  if (data.empty())
    return "";

  // Little-endian base58 digits of the big number
  std::vector<uint8_t> digits;
  for (uint8_t byte : data) {
    uint32_t carry = byte;
    for (size_t j = 0; j < digits.size(); ++j) {
      carry += static_cast<uint32_t>(digits[j]) << 8;
      digits[j] = carry % 58;
      carry /= 58;
    }

    while (carry > 0) {
      digits.push_back(carry % 58);
      carry /= 58;
    }
  }

  std::string result;
  for (uint8_t byte : data) {
    if (byte != 0)
      break;
    result += BASE58_ALPHABET[0];
  }

  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    result += BASE58_ALPHABET[*it];
  }

  return result;
}

std::optional<std::vector<uint8_t>> decode(const std::string &encoded) {
  if (encoded.empty()) {
    return std::vector<uint8_t>{};
  }

  const auto &map = base58_map();

  // Little-endian bytes of the big number
  std::vector<uint8_t> bytes;
  for (char c : encoded) {
    int digit = map[static_cast<unsigned char>(c)];
    if (digit == -1) {
      return std::nullopt;
    }

    uint32_t carry = static_cast<uint32_t>(digit);
    for (size_t j = 0; j < bytes.size(); ++j) {
      carry += static_cast<uint32_t>(bytes[j]) * 58;
      bytes[j] = carry & 0xFF;
      carry >>= 8;
    }

    while (carry > 0) {
      bytes.push_back(carry & 0xFF);
      carry >>= 8;
    }
  }

  size_t leading_zeros = 0;
  for (char c : encoded) {
    if (c != BASE58_ALPHABET[0])
      break;
    leading_zeros++;
  }

  std::vector<uint8_t> result(leading_zeros, 0);
  result.insert(result.end(), bytes.rbegin(), bytes.rend());
  return result;
}

std::optional<PublicKey> decode_pubkey(const std::string &encoded) {
  auto decoded = decode(encoded);
  if (!decoded || decoded->size() != PUBKEY_BYTES) {
    return std::nullopt;
  }
  return decoded;
}

} // namespace base58
} // namespace common
} // namespace palisade
