#pragma once

#include "runtime/account_validator.h"
#include "runtime/byte_order.h"
#include "runtime/host.h"
#include "runtime/pda.h"
#include "runtime/state_codec.h"
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace palisade {
namespace runtime {

/**
 * Named fixed-size field of an instruction payload
 */
struct PayloadField {
    std::string name;
    size_t size = 0;
};

/**
 * Declared shape of one instruction: discriminant, ordered account
 * constraints and ordered payload fields
 */
struct InstructionSchema {
    uint8_t discriminant = 0;
    std::string name;
    std::vector<AccountConstraintSpec> accounts;
    std::vector<PayloadField> payload;

    /// Exact payload length implied by the fields
    size_t payload_len() const;

    std::optional<size_t> field_offset(const std::string& field_name) const;
    const PayloadField* field(const std::string& field_name) const;
};

/**
 * Instruction payload bytes (discriminant excluded), read through the
 * schema's field names. Valid for the invocation only.
 */
class Payload {
public:
    Payload() = default;
    Payload(const uint8_t* data, size_t len, const InstructionSchema* schema)
        : data_(data), len_(len), schema_(schema) {}

    const uint8_t* data() const noexcept { return data_; }
    size_t size() const noexcept { return len_; }
    bool empty() const noexcept { return len_ == 0; }

    std::vector<uint8_t> bytes() const {
        return std::vector<uint8_t>(data_, data_ + len_);
    }

    /// Copy of a declared field; std::nullopt if undeclared or not N bytes wide
    template <size_t N>
    std::optional<FixedBytes<N>> field(const std::string& name) const {
        if (!schema_) return std::nullopt;
        const PayloadField* f = schema_->field(name);
        auto offset = schema_->field_offset(name);
        if (!f || !offset || f->size != N || *offset + N > len_) {
            return std::nullopt;
        }
        FixedBytes<N> out{};
        std::memcpy(out.data(), data_ + *offset, N);
        return out;
    }

    /// Copy the whole payload into a fixed layout
    template <typename T>
    Result<T, ProgramFailure> as() const {
        return parse_payload<T>(data_, len_);
    }

private:
    const uint8_t* data_ = nullptr;
    size_t len_ = 0;
    const InstructionSchema* schema_ = nullptr;
};

/**
 * Everything a handler sees for one invocation
 */
class InstructionContext {
public:
    InstructionContext(const InstructionSchema& schema, const ProgramIds& ids,
                       ValidatedAccounts accounts, Payload payload,
                       const PdaVerifier& pda, HostServices& host)
        : schema_(schema), ids_(ids), accounts_(std::move(accounts)),
          payload_(payload), pda_(pda), host_(host) {}

    const InstructionSchema& schema() const { return schema_; }
    const ProgramIds& ids() const { return ids_; }
    const PublicKey& program_id() const { return ids_.program_id; }

    const ValidatedAccounts& accounts() const { return accounts_; }

    /**
     * Binding by declared name.
     * Fails NOT_ENOUGH_ACCOUNT_KEYS if the schema declares no such account.
     */
    Result<AccountHandle, ProgramFailure> account(const std::string& name) const;

    const Payload& payload() const { return payload_; }
    const PdaVerifier& pda() const { return pda_; }
    HostServices& host() const { return host_; }

    /// assert_pda against the invoking program
    ProgramResult assert_pda(const AccountHandle& account, const Seeds& seeds,
                             uint8_t bump, uint32_t error_code) const {
        return pda_.assert_pda(account, seeds, bump, ids_.program_id, error_code);
    }

private:
    const InstructionSchema& schema_;
    const ProgramIds& ids_;
    ValidatedAccounts accounts_;
    Payload payload_;
    const PdaVerifier& pda_;
    HostServices& host_;
};

/**
 * Business logic for one instruction, run after validation succeeded
 */
class InstructionHandler {
public:
    virtual ~InstructionHandler() = default;
    virtual ProgramResult process(InstructionContext& context) const = 0;
};

/**
 * Handler backed by any callable
 */
class FunctionHandler : public InstructionHandler {
public:
    using HandlerFn = std::function<ProgramResult(InstructionContext&)>;

    explicit FunctionHandler(HandlerFn fn) : fn_(std::move(fn)) {}

    ProgramResult process(InstructionContext& context) const override {
        return fn_(context);
    }

private:
    HandlerFn fn_;
};

inline std::unique_ptr<InstructionHandler> make_handler(FunctionHandler::HandlerFn fn) {
    return std::make_unique<FunctionHandler>(std::move(fn));
}

} // namespace runtime
} // namespace palisade
