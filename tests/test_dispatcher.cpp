/**
 * Unit tests for instruction decoding and dispatch
 *
 * Checks the ordering of structural checks, the stages an instruction
 * reaches, handler invocation and statistics.
 */

#include "runtime/dispatcher.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace palisade::runtime;
using namespace palisade::testing_support;

namespace {

struct AmountArgs {
    static constexpr size_t LEN = 8;
    FixedBytes<8> amount;
};

const std::vector<uint8_t> AMOUNT_BYTES = {0x10, 0x32, 0x54, 0x76, 0x98, 0xBA, 0xDC, 0xFE};

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ids = test_ids();

        InstructionSchema deposit;
        deposit.discriminant = 2;
        deposit.name = "Deposit";
        deposit.accounts = {{"payer", AccountKind::SIGNER, true, ""},
                            {"vault", AccountKind::PROGRAM_OWNED, true, ""}};
        deposit.payload = {{"amount", 8}};

        ASSERT_TRUE(registry
                        .register_instruction(
                            std::move(deposit),
                            make_handler([this](InstructionContext& ctx) {
                                ++handler_calls;
                                seen_payload = ctx.payload().bytes();
                                auto vault = ctx.account("vault");
                                if (vault.is_err()) {
                                    return fail(vault.error());
                                }
                                seen_vault = vault.value().key();
                                auto args = ctx.payload().as<AmountArgs>();
                                if (args.is_err()) {
                                    return fail(args.error());
                                }
                                seen_amount = read_u64_le(args.value().amount);
                                return success();
                            }))
                        .is_ok());

        InstructionSchema reject;
        reject.discriminant = 5;
        reject.name = "Reject";
        ASSERT_TRUE(registry
                        .register_instruction(std::move(reject),
                                              make_handler([this](InstructionContext&) {
                                                  ++handler_calls;
                                                  return fail_custom(6100);
                                              }))
                        .is_ok());

        InstructionSchema undeclared;
        undeclared.discriminant = 6;
        undeclared.name = "AsksForUndeclaredAccount";
        undeclared.accounts = {{"payer", AccountKind::SIGNER, true, ""}};
        ASSERT_TRUE(registry
                        .register_instruction(std::move(undeclared),
                                              make_handler([this](InstructionContext& ctx) {
                                                  ++handler_calls;
                                                  auto missing = ctx.account("treasury");
                                                  if (missing.is_err()) {
                                                      return fail(missing.error());
                                                  }
                                                  return success();
                                              }))
                        .is_ok());

        InstructionSchema fields;
        fields.discriminant = 7;
        fields.name = "ReadFields";
        fields.payload = {{"a", 8}, {"b", 1}};
        ASSERT_TRUE(registry
                        .register_instruction(std::move(fields),
                                              make_handler([this](InstructionContext& ctx) {
                                                  ++handler_calls;
                                                  const Payload& payload = ctx.payload();
                                                  field_a = payload.field<8>("a");
                                                  field_b = payload.field<1>("b");
                                                  undeclared_field = payload.field<8>("c");
                                                  wrong_width = payload.field<4>("a");
                                                  return success();
                                              }))
                        .is_ok());

        registry.seal();
        dispatcher = std::make_unique<Dispatcher>(registry, ids, deriver);

        accounts = {
            make_account(key_of(0x0A), ids.system_program_id, 1000, true, true),
            make_account(key_of(0x0B), ids.program_id, 500, false, true, 16),
        };
    }

    std::vector<uint8_t> deposit_raw() const {
        std::vector<uint8_t> raw = {2};
        raw.insert(raw.end(), AMOUNT_BYTES.begin(), AMOUNT_BYTES.end());
        return raw;
    }

    DispatchOutcome run(const std::vector<uint8_t>& raw) {
        return dispatcher->dispatch(ids.program_id, make_handles(accounts), raw, host);
    }

    ProgramIds ids;
    SchemaRegistry registry;
    Sha256AddressDeriver deriver;
    RecordingHost host;
    std::unique_ptr<Dispatcher> dispatcher;
    std::vector<AccountInfo> accounts;

    int handler_calls = 0;
    std::vector<uint8_t> seen_payload;
    PublicKey seen_vault;
    uint64_t seen_amount = 0;

    std::optional<FixedBytes<8>> field_a;
    std::optional<FixedBytes<1>> field_b;
    std::optional<FixedBytes<8>> undeclared_field;
    std::optional<FixedBytes<4>> wrong_width;
};

// ============================================================================
// Decoding
// ============================================================================

TEST(DecodeInstructionTest, SplitsDiscriminantAndPayload) {
    std::vector<uint8_t> raw = {7, 1, 2, 3};
    auto decoded = decode_instruction(raw);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().discriminant, 7);
    EXPECT_EQ(decoded.value().payload_len, 3u);
    EXPECT_EQ(decoded.value().payload[0], 1);
}

TEST(DecodeInstructionTest, EmptyInputFails) {
    auto decoded = decode_instruction({});
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().error, ProgramError::EMPTY_INSTRUCTION_DATA);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(DispatcherTest, ValidInstructionReachesHandlerWithPayloadUnchanged) {
    auto outcome = run(deposit_raw());

    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(outcome.reached, DispatchStage::DISPATCHED);
    EXPECT_EQ(outcome.status, DispatchStage::SUCCEEDED);
    EXPECT_EQ(outcome.error_code(), 0u);
    EXPECT_EQ(handler_calls, 1);
    EXPECT_EQ(seen_payload, AMOUNT_BYTES);
    EXPECT_EQ(seen_vault, key_of(0x0B));
    EXPECT_EQ(seen_amount, 0xFEDCBA9876543210ULL);
}

TEST_F(DispatcherTest, MissingSignatureStopsBeforeHandler) {
    accounts[0].is_signer = false;

    auto outcome = run(deposit_raw());

    ASSERT_FALSE(outcome.is_success());
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(*outcome.failure, ProgramFailure::at_account(ProgramError::NOT_SIGNER, 0));
    EXPECT_EQ(outcome.failure->category(), ErrorCategory::ACCOUNT_VALIDATION);
    EXPECT_EQ(outcome.reached, DispatchStage::DECODED);
    EXPECT_FALSE(outcome.handler_invoked());
    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, ShortAccountListFailsBeforeConstraintChecks) {
    accounts[0].is_signer = false;
    accounts.pop_back();

    auto outcome = run(deposit_raw());

    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::NOT_ENOUGH_ACCOUNT_KEYS);
    EXPECT_FALSE(outcome.failure->account_index.has_value());
    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, ExtraTrailingAccountsIgnored) {
    accounts.push_back(make_account(key_of(0x0C), key_of(0x99), 0));
    EXPECT_TRUE(run(deposit_raw()).is_success());
}

TEST_F(DispatcherTest, EmptyInstructionData) {
    auto outcome = run({});
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::EMPTY_INSTRUCTION_DATA);
    EXPECT_EQ(outcome.reached, DispatchStage::RECEIVED);
    EXPECT_FALSE(outcome.discriminant.has_value());
}

TEST_F(DispatcherTest, UnknownDiscriminantUsesProgramCode) {
    auto outcome = run({42});

    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::UNKNOWN_DISCRIMINANT);
    EXPECT_EQ(outcome.error_code(), 6001u);
    EXPECT_EQ(outcome.discriminant, std::optional<uint8_t>(42));
    EXPECT_EQ(outcome.reached, DispatchStage::DECODED);
    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, PayloadLengthMustMatchSchema) {
    std::vector<uint8_t> short_raw = deposit_raw();
    short_raw.pop_back();
    auto short_outcome = run(short_raw);
    ASSERT_TRUE(short_outcome.failure.has_value());
    EXPECT_EQ(short_outcome.failure->error, ProgramError::PAYLOAD_SIZE_MISMATCH);

    std::vector<uint8_t> long_raw = deposit_raw();
    long_raw.push_back(0);
    auto long_outcome = run(long_raw);
    ASSERT_TRUE(long_outcome.failure.has_value());
    EXPECT_EQ(long_outcome.failure->error, ProgramError::PAYLOAD_SIZE_MISMATCH);

    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, WrongProgramIdRejected) {
    auto outcome = dispatcher->dispatch(key_of(0xAB), make_handles(accounts),
                                        deposit_raw(), host);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::INCORRECT_PROGRAM_ID);
    EXPECT_EQ(outcome.error_code(), 7ULL << 32);
    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, HandlerFailureIsTerminal) {
    auto outcome = run({5});

    EXPECT_TRUE(outcome.handler_invoked());
    EXPECT_EQ(outcome.status, DispatchStage::FAILED);
    EXPECT_EQ(outcome.error_code(), 6100u);
    EXPECT_EQ(handler_calls, 1);
    EXPECT_TRUE(outcome.result().is_err());
}

TEST_F(DispatcherTest, UndeclaredAccountNameIsTaggedFailure) {
    auto outcome = run({6});

    EXPECT_TRUE(outcome.handler_invoked());
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::NOT_ENOUGH_ACCOUNT_KEYS);
    EXPECT_EQ(outcome.status, DispatchStage::FAILED);

    auto stats = dispatcher->get_stats();
    EXPECT_EQ(stats.dispatched, 1u);
    EXPECT_EQ(stats.succeeded + stats.failed, stats.dispatched);
    EXPECT_EQ(stats.failed, 1u);
}

TEST_F(DispatcherTest, PayloadFieldsReadByName) {
    std::vector<uint8_t> raw = {7};
    raw.insert(raw.end(), AMOUNT_BYTES.begin(), AMOUNT_BYTES.end());
    raw.push_back(0x5A);

    ASSERT_TRUE(run(raw).is_success());
    EXPECT_EQ(handler_calls, 1);

    ASSERT_TRUE(field_a.has_value());
    EXPECT_EQ(read_u64_le(*field_a), 0xFEDCBA9876543210ULL);
    ASSERT_TRUE(field_b.has_value());
    EXPECT_EQ((*field_b)[0], 0x5A);

    EXPECT_FALSE(undeclared_field.has_value());
    EXPECT_FALSE(wrong_width.has_value());
}

TEST(PayloadTest, FieldPastEndOfShortBufferIsAbsent) {
    InstructionSchema schema;
    schema.payload = {{"a", 8}, {"b", 1}};
    std::vector<uint8_t> bytes(8, 0x11);

    Payload truncated(bytes.data(), bytes.size(), &schema);
    EXPECT_TRUE(truncated.field<8>("a").has_value());
    EXPECT_FALSE(truncated.field<1>("b").has_value());

    Payload unbound(bytes.data(), bytes.size(), nullptr);
    EXPECT_FALSE(unbound.field<8>("a").has_value());
}

TEST_F(DispatcherTest, LookupReportsConfiguredCode) {
    EXPECT_TRUE(dispatcher->lookup(2).is_ok());

    auto missing = dispatcher->lookup(3);
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().custom_code, registry.invalid_discriminator_code());
}

TEST_F(DispatcherTest, StatisticsCountOutcomes) {
    run(deposit_raw());
    run({5});
    run({});

    auto stats = dispatcher->get_stats();
    EXPECT_EQ(stats.dispatched, 3u);
    EXPECT_EQ(stats.succeeded, 1u);
    EXPECT_EQ(stats.failed, 2u);

    dispatcher->reset_stats();
    EXPECT_EQ(dispatcher->get_stats().dispatched, 0u);
}

TEST(DispatcherConstructionTest, RequiresSealedRegistry) {
    SchemaRegistry open_registry;
    Sha256AddressDeriver deriver;
    EXPECT_THROW((Dispatcher(open_registry, test_ids(), deriver)), std::invalid_argument);
}

TEST(DispatchStageTest, Names) {
    EXPECT_STREQ(dispatch_stage_name(DispatchStage::VALIDATED), "Validated");
    EXPECT_STREQ(dispatch_stage_name(DispatchStage::FAILED), "Failed");
}

// ============================================================================
// Error codes
// ============================================================================

TEST(ProgramErrorTest, BuiltinKindsShiftIntoHighWord) {
    EXPECT_EQ(ProgramFailure(ProgramError::NOT_SIGNER).code(), 8ULL << 32);
    EXPECT_EQ(ProgramFailure(ProgramError::NOT_OWNED_BY_PROGRAM).code(), 23ULL << 32);
    EXPECT_EQ(ProgramFailure(ProgramError::NOT_ENOUGH_ACCOUNT_KEYS).code(), 11ULL << 32);
    EXPECT_EQ(ProgramFailure(ProgramError::EMPTY_INSTRUCTION_DATA).code(), 3ULL << 32);
    EXPECT_EQ(ProgramFailure(ProgramError::SIZE_MISMATCH).code(), 5ULL << 32);
    EXPECT_EQ(ProgramFailure(ProgramError::INSUFFICIENT_FUNDS).code(), 6ULL << 32);
}

TEST(ProgramErrorTest, CustomCodesMapToThemselves) {
    EXPECT_EQ(ProgramFailure::custom(6002).code(), 6002u);
    EXPECT_EQ(ProgramFailure(ProgramError::PDA_MISMATCH, 6003).code(), 6003u);
    EXPECT_EQ(ProgramFailure(ProgramError::UNKNOWN_DISCRIMINANT, 6001).code(), 6001u);
}

TEST(ProgramErrorTest, Categories) {
    EXPECT_EQ(category_of(ProgramError::NOT_WRITABLE), ErrorCategory::ACCOUNT_VALIDATION);
    EXPECT_EQ(category_of(ProgramError::PAYLOAD_SIZE_MISMATCH), ErrorCategory::STRUCTURAL);
    EXPECT_EQ(category_of(ProgramError::INVALID_SEEDS), ErrorCategory::PDA);
    EXPECT_EQ(category_of(ProgramError::ARITHMETIC_OVERFLOW), ErrorCategory::RUNTIME);
    EXPECT_EQ(category_of(ProgramError::CUSTOM), ErrorCategory::CUSTOM);
    EXPECT_EQ(ProgramFailure(ProgramError::PDA_MISMATCH, 6003).to_string(),
              "PdaError::PdaMismatch(6003)");
}
