#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace palisade {
namespace runtime {

/**
 * Fixed-size byte field used in state and payload layouts.
 *
 * Layouts store numbers as byte arrays so their size and offsets never depend
 * on the platform. Every persisted number is little-endian; use the helpers
 * below rather than reinterpreting the bytes.
 */
template <size_t N> using FixedBytes = std::array<uint8_t, N>;

template <typename UInt, size_t N>
inline UInt read_le(const FixedBytes<N>& bytes) noexcept {
    static_assert(sizeof(UInt) == N, "field width must match integer width");
    UInt value = 0;
    for (size_t i = 0; i < N; ++i) {
        value |= static_cast<UInt>(bytes[i]) << (i * 8);
    }
    return value;
}

template <typename UInt, size_t N>
inline void write_le(FixedBytes<N>& bytes, UInt value) noexcept {
    static_assert(sizeof(UInt) == N, "field width must match integer width");
    for (size_t i = 0; i < N; ++i) {
        bytes[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

inline uint16_t read_u16_le(const FixedBytes<2>& bytes) noexcept {
    return read_le<uint16_t>(bytes);
}

inline uint32_t read_u32_le(const FixedBytes<4>& bytes) noexcept {
    return read_le<uint32_t>(bytes);
}

inline uint64_t read_u64_le(const FixedBytes<8>& bytes) noexcept {
    return read_le<uint64_t>(bytes);
}

inline int64_t read_i64_le(const FixedBytes<8>& bytes) noexcept {
    return static_cast<int64_t>(read_le<uint64_t>(bytes));
}

inline void write_u16_le(FixedBytes<2>& bytes, uint16_t value) noexcept {
    write_le<uint16_t>(bytes, value);
}

inline void write_u32_le(FixedBytes<4>& bytes, uint32_t value) noexcept {
    write_le<uint32_t>(bytes, value);
}

inline void write_u64_le(FixedBytes<8>& bytes, uint64_t value) noexcept {
    write_le<uint64_t>(bytes, value);
}

inline void write_i64_le(FixedBytes<8>& bytes, int64_t value) noexcept {
    write_le<uint64_t>(bytes, static_cast<uint64_t>(value));
}

inline FixedBytes<8> u64_le(uint64_t value) noexcept {
    FixedBytes<8> bytes{};
    write_u64_le(bytes, value);
    return bytes;
}

} // namespace runtime
} // namespace palisade
