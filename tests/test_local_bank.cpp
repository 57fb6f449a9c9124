/**
 * Unit tests for the in-memory host: commit and rollback, lamport transfers,
 * PDA account creation and account closing
 */

#include "runtime/local_bank.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <limits>

using namespace palisade::runtime;
using namespace palisade::testing_support;

namespace {

enum : uint8_t {
    TRANSFER = 0,
    WRITE_THEN_FAIL = 1,
    CREATE = 2,
    CLOSE = 3,
    TOUCH_READONLY = 4,
    TRANSFER_ALIASED = 5
};

const Lamports TRANSFER_AMOUNT = 250;

} // namespace

class LocalBankTest : public ::testing::Test {
protected:
    void SetUp() override {
        ids = test_ids();

        add(TRANSFER, "Transfer",
            {{"from", AccountKind::SIGNER, true, ""}, {"to", AccountKind::ANY, true, ""}},
            [](InstructionContext& ctx) {
                return ctx.host().transfer_lamports(ctx.accounts()[0], ctx.accounts()[1],
                                                    TRANSFER_AMOUNT);
            });

        add(WRITE_THEN_FAIL, "WriteThenFail",
            {{"state", AccountKind::PROGRAM_OWNED, true, ""}},
            [](InstructionContext& ctx) {
                AccountHandle state = ctx.accounts()[0];
                state.data()[0] = 0xEE;
                state.set_lamports(state.lamports() + 1);
                return fail_custom(6200);
            });

        add(CREATE, "Create",
            {{"payer", AccountKind::SIGNER, true, ""},
             {"target", AccountKind::UNINITIALIZED, false, ""}},
            [](InstructionContext& ctx) {
                Seeds seeds = {seed_bytes("vault")};
                auto derived = ctx.pda().derive(seeds, ctx.program_id());
                if (derived.is_err()) {
                    return fail(derived.error());
                }
                return ctx.host().create_pda_account(ctx.accounts()[0], ctx.accounts()[1],
                                                     16, ctx.program_id(),
                                                     with_bump(seeds, derived.value().bump));
            });

        add(CLOSE, "Close",
            {{"state", AccountKind::PROGRAM_OWNED, true, ""},
             {"receiver", AccountKind::ANY, true, ""}},
            [](InstructionContext& ctx) {
                return close_account(ctx.accounts()[0], ctx.accounts()[1],
                                     ctx.ids().system_program_id);
            });

        add(TOUCH_READONLY, "TouchReadonly",
            {{"state", AccountKind::PROGRAM_OWNED, false, ""}},
            [](InstructionContext& ctx) {
                ctx.accounts()[0].data()[0] = 0x01;
                return success();
            });

        add(TRANSFER_ALIASED, "TransferAliased",
            {{"from", AccountKind::SIGNER, true, ""}, {"to", AccountKind::ANY, true, ""}},
            [](InstructionContext& ctx) {
                AccountHandle from = ctx.accounts()[0];
                AccountHandle to = ctx.accounts()[1];
                EXPECT_TRUE(from.aliases(to));
                return ctx.host().transfer_lamports(from, to, TRANSFER_AMOUNT);
            });

        registry.seal();
        dispatcher = std::make_unique<Dispatcher>(registry, ids, deriver);
        bank = std::make_unique<LocalBank>(RentCalculator(), ids.system_program_id);

        bank->set_account(alice, 1000000000, ids.system_program_id);
        bank->set_account(bob, 100, ids.system_program_id);
        bank->set_account(state_key, 5000, ids.program_id, std::vector<uint8_t>(8, 0));
    }

    void add(uint8_t discriminant, const std::string& name,
             std::vector<AccountConstraintSpec> accounts, FunctionHandler::HandlerFn fn) {
        InstructionSchema schema;
        schema.discriminant = discriminant;
        schema.name = name;
        schema.accounts = std::move(accounts);
        ASSERT_TRUE(registry.register_instruction(std::move(schema), make_handler(std::move(fn)))
                        .is_ok());
    }

    Lamports balance(const PublicKey& key) const {
        auto account = bank->get_account(key);
        return account ? account->lamports : 0;
    }

    ProgramIds ids;
    SchemaRegistry registry;
    Sha256AddressDeriver deriver;
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<LocalBank> bank;

    PublicKey alice = key_of(0x01);
    PublicKey bob = key_of(0x02);
    PublicKey state_key = key_of(0x03);
};

// ============================================================================
// Commit and rollback
// ============================================================================

TEST_F(LocalBankTest, SuccessfulTransferCommits) {
    auto outcome = bank->invoke(*dispatcher,
                                {AccountMeta::signer(alice, true), AccountMeta::writable(bob)},
                                {TRANSFER});
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(balance(alice), 1000000000 - TRANSFER_AMOUNT);
    EXPECT_EQ(balance(bob), 100 + TRANSFER_AMOUNT);
}

TEST_F(LocalBankTest, FailedInstructionRollsBack) {
    auto before = bank->get_account(state_key);

    auto outcome = bank->invoke(*dispatcher, {AccountMeta::writable(state_key)},
                                {WRITE_THEN_FAIL});
    ASSERT_FALSE(outcome.is_success());
    EXPECT_EQ(outcome.error_code(), 6200u);

    auto after = bank->get_account(state_key);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->data, before->data);
    EXPECT_EQ(after->lamports, before->lamports);
}

TEST_F(LocalBankTest, ReadOnlyModificationIsRejected) {
    auto outcome = bank->invoke(*dispatcher, {AccountMeta::readonly(state_key)},
                                {TOUCH_READONLY});
    ASSERT_FALSE(outcome.is_success());
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::NOT_WRITABLE);
    EXPECT_EQ(bank->get_account(state_key)->data[0], 0);
}

TEST_F(LocalBankTest, UnknownKeysStartEmptyAndSystemOwned) {
    PublicKey stranger = key_of(0x50);
    auto outcome = bank->invoke(*dispatcher,
                                {AccountMeta::signer(alice, true), AccountMeta::writable(stranger)},
                                {TRANSFER});
    ASSERT_TRUE(outcome.is_success());

    auto created = bank->get_account(stranger);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->lamports, TRANSFER_AMOUNT);
    EXPECT_EQ(created->owner, ids.system_program_id);
}

TEST_F(LocalBankTest, DuplicateKeysShareOneRecord) {
    auto outcome = bank->invoke(*dispatcher,
                                {AccountMeta::signer(alice, true), AccountMeta::writable(alice)},
                                {TRANSFER_ALIASED});
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(balance(alice), 1000000000u);
}

TEST_F(LocalBankTest, WrongProgramIdNeverRuns) {
    auto outcome = bank->invoke(*dispatcher, key_of(0x77),
                                {AccountMeta::signer(alice, true), AccountMeta::writable(bob)},
                                {TRANSFER});
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::INCORRECT_PROGRAM_ID);
    EXPECT_EQ(balance(bob), 100u);
}

// ============================================================================
// Host services
// ============================================================================

TEST_F(LocalBankTest, TransferChecks) {
    AccountInfo rich = make_account(key_of(0x10), ids.system_program_id, 10, true, true);
    AccountInfo unsigned_from = make_account(key_of(0x11), ids.system_program_id, 10, false, true);
    AccountInfo readonly_to = make_account(key_of(0x12), ids.system_program_id, 0, false, false);
    AccountInfo full = make_account(key_of(0x13), ids.system_program_id,
                                    std::numeric_limits<Lamports>::max(), false, true);
    AccountInfo sink = make_account(key_of(0x14), ids.system_program_id, 0, false, true);

    EXPECT_EQ(bank->transfer_lamports(AccountHandle(&rich), AccountHandle(&sink), 11).error().error,
              ProgramError::INSUFFICIENT_FUNDS);
    EXPECT_EQ(bank->transfer_lamports(AccountHandle(&unsigned_from), AccountHandle(&sink), 1)
                  .error().error,
              ProgramError::NOT_SIGNER);
    EXPECT_EQ(bank->transfer_lamports(AccountHandle(&rich), AccountHandle(&readonly_to), 1)
                  .error().error,
              ProgramError::NOT_WRITABLE);
    EXPECT_EQ(bank->transfer_lamports(AccountHandle(&rich), AccountHandle(&full), 1).error().error,
              ProgramError::ARITHMETIC_OVERFLOW);

    EXPECT_TRUE(bank->transfer_lamports(AccountHandle(&rich), AccountHandle(&sink), 10).is_ok());
    EXPECT_EQ(rich.lamports, 0u);
    EXPECT_EQ(sink.lamports, 10u);
}

TEST_F(LocalBankTest, CreatePdaAccountIsRentExempt) {
    auto derived = dispatcher->pda().derive({seed_bytes("vault")}, ids.program_id);
    ASSERT_TRUE(derived.is_ok());
    const PublicKey& vault = derived.value().address;

    auto outcome = bank->invoke(*dispatcher,
                                {AccountMeta::signer(alice, true), AccountMeta::writable(vault)},
                                {CREATE});
    ASSERT_TRUE(outcome.is_success());

    auto created = bank->get_account(vault);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->owner, ids.program_id);
    EXPECT_EQ(created->data.size(), 16u);
    EXPECT_TRUE(bank->rent().is_rent_exempt(created->lamports, 16));
    EXPECT_EQ(balance(alice), 1000000000 - bank->rent().minimum_balance(16));

    // Second creation: the account is no longer uninitialized
    auto again = bank->invoke(*dispatcher,
                              {AccountMeta::signer(alice, true), AccountMeta::writable(vault)},
                              {CREATE});
    ASSERT_TRUE(again.failure.has_value());
    EXPECT_EQ(again.failure->error, ProgramError::ALREADY_INITIALIZED);
    EXPECT_EQ(again.failure->account_index, std::optional<size_t>(1));
}

TEST_F(LocalBankTest, CreateRejectsAddressNotDerivedFromSeeds) {
    auto outcome = bank->invoke(*dispatcher,
                                {AccountMeta::signer(alice, true),
                                 AccountMeta::writable(key_of(0x60))},
                                {CREATE});
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::INVALID_SEEDS);
    EXPECT_FALSE(bank->has_account(key_of(0x60)));
    EXPECT_EQ(balance(alice), 1000000000u);
}

TEST_F(LocalBankTest, CreateRequiresFunds) {
    auto derived = dispatcher->pda().derive({seed_bytes("vault")}, ids.program_id);
    ASSERT_TRUE(derived.is_ok());

    auto outcome = bank->invoke(*dispatcher,
                                {AccountMeta::signer(bob, true),
                                 AccountMeta::writable(derived.value().address)},
                                {CREATE});
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->error, ProgramError::INSUFFICIENT_FUNDS);
}

TEST_F(LocalBankTest, CloseDropsAccountAndPaysReceiver) {
    auto outcome = bank->invoke(*dispatcher,
                                {AccountMeta::writable(state_key), AccountMeta::writable(bob)},
                                {CLOSE});
    ASSERT_TRUE(outcome.is_success());
    EXPECT_FALSE(bank->has_account(state_key));
    EXPECT_EQ(balance(bob), 5100u);
}

TEST(CloseAccountTest, MarksClosedAndReassignsOwner) {
    PublicKey system_program(PUBKEY_BYTES, 0);
    AccountInfo state = make_account(key_of(1), key_of(0xAA), 70, false, true, 4);
    state.data = {9, 9, 9, 9};
    AccountInfo receiver = make_account(key_of(2), system_program, 30, false, true);

    ASSERT_TRUE(close_account(AccountHandle(&state), AccountHandle(&receiver), system_program)
                    .is_ok());
    EXPECT_EQ(state.lamports, 0u);
    EXPECT_EQ(receiver.lamports, 100u);
    EXPECT_EQ(state.data, (std::vector<uint8_t>{CLOSED_ACCOUNT_MARKER, 0, 0, 0}));
    EXPECT_EQ(state.owner, system_program);

    AccountInfo readonly = make_account(key_of(3), key_of(0xAA), 5, false, false, 1);
    auto denied = close_account(AccountHandle(&readonly), AccountHandle(&receiver), system_program);
    ASSERT_TRUE(denied.is_err());
    EXPECT_EQ(denied.error().error, ProgramError::NOT_WRITABLE);
}

TEST_F(LocalBankTest, ClockIsConfigurable) {
    Clock clock;
    clock.slot = 99;
    clock.unix_timestamp = 1700000000;
    bank->set_clock(clock);
    EXPECT_EQ(bank->clock().slot, 99u);
    EXPECT_EQ(bank->clock().unix_timestamp, 1700000000);
}
