#pragma once

#include "runtime/account.h"
#include "runtime/byte_order.h"
#include "runtime/program_error.h"
#include <cstddef>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace palisade {
namespace runtime {

/**
 * Runtime description of one field of a fixed layout
 */
struct FieldDescriptor {
    std::string name;
    size_t offset = 0;
    size_t size = 0;
};

/**
 * Runtime description of a fixed layout, used by the registry to check the
 * layout and by tools that document it
 */
struct LayoutDescriptor {
    std::string name;
    size_t len = 0;
    std::vector<FieldDescriptor> fields;

    const FieldDescriptor* field(const std::string& field_name) const;
};

/// Fields in declaration order, no gaps, no overlap, sizes summing to len
bool is_contiguous(const LayoutDescriptor& layout);

#define PALISADE_FIELD(Type, member) \
    ::palisade::runtime::FieldDescriptor{#member, offsetof(Type, member), sizeof(Type::member)}

/**
 * A state layout is a standard-layout, trivially copyable struct made only of
 * byte fields (FixedBytes<N> or uint8_t), so alignment is 1 and it can be
 * overlaid on any buffer. T::LEN must equal sizeof(T).
 */
template <typename T>
struct is_fixed_layout
    : std::integral_constant<bool, std::is_trivially_copyable<T>::value &&
                                       std::is_standard_layout<T>::value &&
                                       alignof(T) == 1> {};

template <typename T> constexpr void check_layout() {
    static_assert(is_fixed_layout<T>::value,
                  "layout must be a trivially copyable struct of byte fields");
    static_assert(sizeof(T) == T::LEN, "LEN must equal the sum of field sizes");
}

/**
 * Read-only overlay of the account buffer.
 * Fails SIZE_MISMATCH when the buffer is shorter than T::LEN. Bytes past
 * T::LEN are left alone.
 */
template <typename T>
Result<const T*, ProgramFailure> load(const AccountHandle& account) {
    check_layout<T>();
    if (account.data_len() < T::LEN) {
        return make_error(ProgramFailure(ProgramError::SIZE_MISMATCH));
    }
    return Result<const T*, ProgramFailure>(
        reinterpret_cast<const T*>(account.data()));
}

/**
 * Mutable overlay of the account buffer.
 * The caller guarantees no other live view of the same buffer while this one
 * is in use; the codec does no locking and no aliasing checks.
 */
template <typename T>
Result<T*, ProgramFailure> load_mut(const AccountHandle& account) {
    check_layout<T>();
    if (account.data_len() < T::LEN) {
        return make_error(ProgramFailure(ProgramError::SIZE_MISMATCH));
    }
    return Result<T*, ProgramFailure>(reinterpret_cast<T*>(account.data()));
}

/**
 * Overlay without the length check.
 *
 * Precondition: the buffer was already checked to hold at least T::LEN bytes
 * in this invocation. Violating it reads or writes out of bounds.
 */
template <typename T>
T* load_unchecked(const AccountHandle& account) noexcept {
    check_layout<T>();
    return reinterpret_cast<T*>(account.data());
}

/**
 * Run body with a mutable view that only lives for the call.
 * body takes T& and returns void or ProgramResult.
 */
template <typename T, typename Body>
ProgramResult with_state(const AccountHandle& account, Body&& body) {
    auto state = load_mut<T>(account);
    if (state.is_err()) {
        return fail(state.error());
    }
    T& view = *state.value();
    if constexpr (std::is_void<std::invoke_result_t<Body, T&>>::value) {
        body(view);
        return success();
    } else {
        return body(view);
    }
}

/**
 * Copy a fixed-size payload out of instruction bytes.
 * Fails PAYLOAD_SIZE_MISMATCH unless len == T::LEN exactly.
 */
template <typename T>
Result<T, ProgramFailure> parse_payload(const uint8_t* data, size_t len) {
    check_layout<T>();
    if (len != T::LEN) {
        return make_error(ProgramFailure(ProgramError::PAYLOAD_SIZE_MISMATCH));
    }
    T value;
    if (len > 0) {
        std::memcpy(&value, data, T::LEN);
    }
    return Result<T, ProgramFailure>(value);
}

} // namespace runtime
} // namespace palisade
