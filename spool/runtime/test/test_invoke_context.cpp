// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <spool/core/byte_string.hpp>
#include <spool/native/system/system_instruction.hpp>
#include <spool/native/system/system_program.hpp>
#include <spool/runtime/account.hpp>
#include <spool/runtime/instruction.hpp>
#include <spool/runtime/instruction_error.hpp>
#include <spool/runtime/invoke_context.hpp>
#include <spool/runtime/ledger.hpp>
#include <spool/runtime/program.hpp>
#include <spool/runtime/pubkey.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <vector>

using namespace spool;

namespace
{
    constexpr Pubkey PROBE_ID{0x70726f6265_bytes32};
    constexpr Pubkey OTHER_ID{0x6f74686572_bytes32};

    enum class Op : uint8_t
    {
        WriteData,
        Debit,
        Mint,
        SignedTransfer,
        UnsignedTransfer,
        Recurse,
        ReturnData,
        Reassign,
    };

    // Misbehaves on request so every frame check can be hit
    class ProbeProgram final : public Program
    {
    public:
        Pubkey const &id() const noexcept override
        {
            return PROBE_ID;
        }

        Result<void> process_instruction(
            InvokeContext &ctx, AccountInfos const accounts,
            byte_string_view const data) override
        {
            switch (static_cast<Op>(data[0])) {
            case Op::WriteData:
                accounts[0].data_mut()[0] = 1;
                break;
            case Op::Debit:
                accounts[0].set_lamports(accounts[0].lamports() - 1);
                accounts[1].set_lamports(accounts[1].lamports() + 1);
                break;
            case Op::Mint:
                accounts[0].set_lamports(accounts[0].lamports() + 1);
                break;
            case Op::SignedTransfer: {
                unsigned char const bump[1] = {data[1]};
                std::vector<std::vector<byte_string_view>> const seeds{
                    {to_byte_string_view("vault"), to_byte_string_view(bump)}};
                return ctx.invoke_signed(
                    system::transfer(accounts[0].key(), accounts[1].key(), 5),
                    accounts,
                    seeds);
            }
            case Op::UnsignedTransfer:
                return ctx.invoke(
                    system::transfer(accounts[0].key(), accounts[1].key(), 5),
                    accounts);
            case Op::Recurse:
                return ctx.invoke(
                    Instruction{PROBE_ID, {}, byte_string{data}}, accounts);
            case Op::ReturnData:
                ctx.set_return_data(data.substr(1));
                break;
            case Op::Reassign:
                accounts[0].assign(OTHER_ID);
                break;
            }
            return outcome::success();
        }
    };

    class InvokeContextTest : public ::testing::Test
    {
    protected:
        Ledger ledger;
        ProgramMap programs;
        Clock clock;
        Rent rent;
        Pubkey owned{0x0a_bytes32};
        Pubkey foreign{0x0b_bytes32};

        InvokeContextTest()
        {
            programs.emplace(
                SYSTEM_PROGRAM_ID, std::make_unique<system::SystemProgram>());
            programs.emplace(PROBE_ID, std::make_unique<ProbeProgram>());
            ledger.store(
                owned,
                Account{
                    .lamports = 100,
                    .data = byte_string(8, 0),
                    .owner = PROBE_ID});
            ledger.store(foreign, Account{.lamports = 100});
        }

        Result<void> run(
            Op const op, std::vector<AccountMeta> accounts,
            byte_string extra = {}, std::vector<Pubkey> const &signers = {})
        {
            byte_string data{static_cast<uint8_t>(op)};
            data += extra;
            InvokeContext ctx{ledger, programs, clock, rent, 4};
            return ctx.process_instruction(
                Instruction{PROBE_ID, std::move(accounts), std::move(data)},
                signers);
        }
    };
}

TEST_F(InvokeContextTest, owner_may_write_data)
{
    auto const res = run(Op::WriteData, {AccountMeta::writable(owned)});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(ledger.find(owned)->data[0], 1);
}

TEST_F(InvokeContextTest, readonly_data_change_rejected)
{
    auto const res = run(Op::WriteData, {AccountMeta::readonly(owned)});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), InstructionError::ReadonlyDataModified);
    // the frame is rolled back
    EXPECT_EQ(ledger.find(owned)->data[0], 0);
}

TEST_F(InvokeContextTest, foreign_data_change_rejected)
{
    ledger.touch(foreign).data = byte_string(8, 0);
    auto const res = run(Op::WriteData, {AccountMeta::writable(foreign)});
    EXPECT_EQ(res.error(), InstructionError::ExternalAccountDataModified);
}

TEST_F(InvokeContextTest, only_owner_debits)
{
    EXPECT_FALSE(
        run(Op::Debit,
            {AccountMeta::writable(owned), AccountMeta::writable(foreign)})
            .has_error());
    EXPECT_EQ(ledger.find(owned)->lamports, 99u);
    EXPECT_EQ(ledger.find(foreign)->lamports, 101u);

    auto const res =
        run(Op::Debit,
            {AccountMeta::writable(foreign), AccountMeta::writable(owned)});
    EXPECT_EQ(res.error(), InstructionError::ExternalAccountLamportSpend);

    auto const readonly =
        run(Op::Debit,
            {AccountMeta::writable(owned), AccountMeta::readonly(foreign)});
    EXPECT_EQ(readonly.error(), InstructionError::ReadonlyLamportChange);
}

TEST_F(InvokeContextTest, lamports_are_conserved)
{
    auto const res = run(Op::Mint, {AccountMeta::writable(owned)});
    EXPECT_EQ(res.error(), InstructionError::UnbalancedInstruction);
    EXPECT_EQ(ledger.find(owned)->lamports, 100u);
}

TEST_F(InvokeContextTest, reassign_requires_zeroed_data)
{
    EXPECT_FALSE(run(Op::Reassign, {AccountMeta::writable(owned)}).has_error());
    EXPECT_EQ(ledger.find(owned)->owner, OTHER_ID);

    ledger.store(
        owned,
        Account{.lamports = 100, .data = byte_string(8, 1), .owner = PROBE_ID});
    auto const res = run(Op::Reassign, {AccountMeta::writable(owned)});
    EXPECT_EQ(res.error(), InstructionError::ModifiedProgramId);
}

TEST_F(InvokeContextTest, missing_signature)
{
    auto const res =
        run(Op::Mint, {AccountMeta::writable(foreign, true)}, {}, {});
    EXPECT_EQ(res.error(), InstructionError::MissingRequiredSignature);
}

TEST_F(InvokeContextTest, derived_address_signs_inner_instruction)
{
    std::vector<byte_string_view> const seeds{to_byte_string_view("vault")};
    auto const found = try_find_program_address(seeds, PROBE_ID);
    ASSERT_TRUE(found.has_value());
    auto const [vault, bump] = found.value();
    ledger.store(vault, Account{.lamports = 50});

    std::vector<AccountMeta> const accounts{
        AccountMeta::writable(vault),
        AccountMeta::writable(foreign),
        AccountMeta::readonly(SYSTEM_PROGRAM_ID)};

    auto const unsigned_res = run(Op::UnsignedTransfer, accounts);
    EXPECT_EQ(unsigned_res.error(), InstructionError::PrivilegeEscalation);

    auto const wrong_bump =
        run(Op::SignedTransfer,
            accounts,
            byte_string{static_cast<uint8_t>(bump - 1)});
    EXPECT_TRUE(wrong_bump.has_error());

    auto const res = run(Op::SignedTransfer, accounts, byte_string{bump});
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    EXPECT_EQ(ledger.find(vault)->lamports, 45u);
    EXPECT_EQ(ledger.find(foreign)->lamports, 105u);
}

TEST_F(InvokeContextTest, inner_instruction_cannot_escalate_writability)
{
    // the inner transfer credits the second account, passed read-only here
    auto const res = run(
        Op::UnsignedTransfer,
        {AccountMeta::writable(foreign, true),
         AccountMeta::readonly(SYSTEM_PROGRAM_ID)},
        {},
        {foreign});
    EXPECT_EQ(res.error(), InstructionError::PrivilegeEscalation);
    EXPECT_EQ(ledger.find(foreign)->lamports, 100u);
}

TEST_F(InvokeContextTest, call_depth_is_bounded)
{
    auto const res = run(Op::Recurse, {});
    EXPECT_EQ(res.error(), InstructionError::CallDepth);
}

TEST_F(InvokeContextTest, unknown_program)
{
    InvokeContext ctx{ledger, programs, clock, rent, 4};
    auto const res = ctx.process_instruction(
        Instruction{OTHER_ID, {}, {}}, std::vector<Pubkey>{});
    EXPECT_EQ(res.error(), InstructionError::UnsupportedProgramId);
}

TEST_F(InvokeContextTest, return_data_names_program)
{
    InvokeContext ctx{ledger, programs, clock, rent, 4};
    auto const res = ctx.process_instruction(
        Instruction{PROBE_ID, {}, byte_string{6, 0xbe, 0xef}},
        std::vector<Pubkey>{});
    ASSERT_FALSE(res.has_error());
    ASSERT_TRUE(ctx.return_data().has_value());
    EXPECT_EQ(ctx.return_data()->program_id, PROBE_ID);
    EXPECT_EQ(ctx.return_data()->data, (byte_string{0xbe, 0xef}));
}
