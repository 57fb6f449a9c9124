#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace palisade {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout Palisade
 *
 * This header defines the key and balance aliases shared by every module and
 * the Result<T, E> wrapper used on all fallible paths.
 */

/// @brief Cryptographic hash representation (SHA-256, 32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Account address / Ed25519 public key representation (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Slot number reported by the clock oracle
using Slot = uint64_t;

/// @brief Epoch number used for rent bookkeeping
using Epoch = uint64_t;

/// @brief Native balance in smallest unit
using Lamports = uint64_t;

/// @brief Seconds since the Unix epoch as reported by the clock oracle
using UnixTimestamp = int64_t;

/// @brief Size of an account address in bytes
constexpr size_t PUBKEY_BYTES = 32;

/**
 * @brief Error payload tag used to construct a failed Result
 *
 * Keeps construction unambiguous when the value and error types coincide.
 */
template <typename E> struct Err {
  E error;
};

/// Build an Err<E> from any error value
template <typename E> Err<typename std::decay<E>::type> make_error(E &&error) {
  return Err<typename std::decay<E>::type>{std::forward<E>(error)};
}

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value of type T or an error of type E. Used on the
 * instruction path in place of exceptions.
 *
 * @tparam T The type of the success value (must be default constructible)
 * @tparam E The type of the error value
 *
 * Example usage:
 * @code
 * auto accounts = validate_accounts(handles, schema.accounts, ids);
 * if (accounts.is_err()) {
 *     return ProgramResult(make_error(accounts.error()));
 * }
 * @endcode
 */
template <typename T, typename E = std::string> class Result {
private:
  bool success_;
  T value_;
  E error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)), error_() {}

  /**
   * @brief Construct a failed result
   * @param err Error wrapper produced by make_error()
   */
  Result(Err<E> err) : success_(false), value_(), error_(std::move(err.error)) {}

  Result(const Result &other) = default;
  Result(Result &&other) = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) = default;

  /**
   * @brief Check if the result represents success
   * @return true if the operation succeeded, false otherwise
   */
  bool is_ok() const noexcept { return success_; }

  /**
   * @brief Check if the result represents failure
   * @return true if the operation failed, false otherwise
   */
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value (lvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /**
   * @brief Get the success value (rvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error value
   * @warning Only call this if is_err() returns true
   */
  const E &error() const noexcept { return error_; }

  /// Check if result contains a value (for conditional usage)
  explicit operator bool() const noexcept { return success_; }

  /**
   * @brief Get value or return default on error
   * @param default_value Value to return if result is an error
   */
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace palisade

/**
 * @brief Standard library hash specialization for byte vectors
 *
 * Enables use of Hash and PublicKey as keys in std::unordered_map and
 * std::unordered_set containers.
 */
namespace std {
template <> struct hash<std::vector<uint8_t>> {
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      // Boost-style hash combine
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
