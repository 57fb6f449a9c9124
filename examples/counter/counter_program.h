#pragma once

#include "runtime/byte_order.h"
#include "runtime/dispatcher.h"
#include "runtime/schema_registry.h"
#include "runtime/state_codec.h"

namespace palisade {
namespace counter {

using namespace palisade::runtime;

/// Base58 id the counter program is deployed under by default
extern const char* const COUNTER_PROGRAM_ADDRESS;

/// First seed of every counter PDA; the owner key follows
extern const char COUNTER_SEED[];

enum class CounterInstruction : uint8_t {
    INITIALIZE_COUNTER = 0,
    INCREMENT = 1,
    DECREMENT = 2
};

/**
 * Custom program errors, reported as their own numeric codes
 */
enum class CounterError : uint32_t {
    INVALID_DISCRIMINATOR = 6001,
    UNAUTHORIZED = 6002,
    COUNTER_KEY_INCORRECT = 6003,
    COUNTER_ALREADY_INITIALIZED = 6004,
    COUNTER_NOT_INITIALIZED = 6005,
    COUNTER_UNDERFLOW = 6006
};

inline uint32_t code(CounterError error) { return static_cast<uint32_t>(error); }

/**
 * Persisted counter account: owner key, little-endian count, PDA bump
 */
struct Counter {
    static constexpr size_t LEN = 41;

    FixedBytes<32> owner;
    FixedBytes<8> count;
    uint8_t bump;

    uint64_t get_count() const noexcept { return read_u64_le(count); }
    void set_count(uint64_t value) noexcept { write_u64_le(count, value); }

    bool is_owned_by(const PublicKey& key) const;
    void set_owner(const PublicKey& key);

    static LayoutDescriptor descriptor();
};

/// Seeds for the counter of owner, bump excluded
Seeds counter_seeds(const PublicKey& owner);

/**
 * Register the counter's instructions, layout and errors, then seal.
 * @return false if any registration was refused
 */
bool register_counter_program(SchemaRegistry& registry);

/// Raw instruction bytes for a counter instruction (no payload)
std::vector<uint8_t> instruction_data(CounterInstruction instruction);

} // namespace counter
} // namespace palisade
