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

#include <splice/core/byte_string.hpp>
#include <splice/core/bytes.hpp>
#include <splice/core/int.hpp>
#include <splice/execution/asset/fungible_asset.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/host/contract.hpp>
#include <splice/execution/host/execute_transaction.hpp>
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/module/constants.hpp>
#include <splice/execution/module/injection_error.hpp>
#include <splice/execution/module/injection_router.hpp>
#include <splice/execution/state/ledger.hpp>
#include <splice/execution/state/state.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <memory>
#include <string_view>

using namespace splice;

namespace
{
    constexpr auto TOKEN = 0x00000000000000000000000000000000000a55e7_address;
    constexpr auto MINTER = 0x000000000000000000000000000000000000beef_address;
    constexpr auto RECORDER = 0x00000000000000000000000000000000000dec0d_address;
    constexpr auto LOCKED = 0x00000000000000000000000000000000000010cd_address;
    constexpr auto user = 0x0000000000000000000000000000000000000123_address;
    constexpr auto payee = 0xb0b0000000000000000000000000000000000002_address;
    constexpr auto placeholder =
        0xfeedfeedfeedfeedfeedfeedfeedfeedfeedfeedfeedfeedfeedfeedfeedfeed_bytes32;

    constexpr uint32_t INJECT_AND_CALL = abi_encode_selector(
        "injectAndCall(address,address,bytes,uint256,bytes32)");
    constexpr uint32_t INJECT_SWEEP_AND_CALL = abi_encode_selector(
        "injectSweepAndCall(address,address,bytes,uint256,bytes32)");
    constexpr uint32_t TARGET_CALL_FAILED =
        abi_encode_selector("TargetCallFailed(bytes)");
    constexpr uint32_t TRANSFER =
        abi_encode_selector("transfer(address,uint256)");
    constexpr uint32_t APPROVE = abi_encode_selector("approve(address,uint256)");
    constexpr uint32_t MINT = abi_encode_selector("mint(address,uint256)");
    constexpr bytes32_t AMOUNT_INJECTED_EVENT = abi_encode_event_signature(
        "AmountInjected(address,address,bytes32,uint256,uint256,bool,bytes)");

    constexpr uint8_t FAIL = 0xff;

    // Keeps the last input and value it was called with.
    struct Recorder : public NativeContract
    {
        byte_string input;
        uint256_t value{0};

        evmc::Result execute(Host &, evmc_message const &msg) override
        {
            input.assign(msg.input_data, msg.input_size);
            value = intx::be::load<uint256_t>(msg.value);
            if (!input.empty() && input[0] == FAIL) {
                byte_string const reason{'n', 'o', 'p', 'e'};
                return make_revert_result(reason, msg.gas);
            }
            byte_string const ok{'o', 'k'};
            return make_success_result(ok, msg.gas);
        }
    };

    // Reports a balance to static calls and refuses everything else.
    struct LockedAsset : public NativeContract
    {
        evmc::Result execute(Host &, evmc_message const &msg) override
        {
            if (msg.flags & EVMC_STATIC) {
                auto const word = abi_encode_uint(u256_be{50});
                return make_success_result(
                    byte_string_view{word.bytes, sizeof(word.bytes)},
                    msg.gas);
            }
            byte_string const reason{'l', 'o', 'c', 'k', 'e', 'd'};
            return make_revert_result(reason, msg.gas);
        }
    };

    byte_string token_call(
        uint32_t const selector, Address const &a, uint256_t const &amount)
    {
        AbiEncoder encoder;
        encoder.add_address(a);
        encoder.add_uint(u256_be{amount});
        return abi_encode_call(selector, encoder.encode_final());
    }

    // selector-like prefix, then the placeholder, then a trailer
    byte_string recorder_input(uint8_t const first = 0x01)
    {
        byte_string input{first, 0x02, 0x03, 0x04};
        input += placeholder;
        input += byte_string{0xaa, 0xbb};
        return input;
    }

    byte_string router_call(
        uint32_t const selector, Address const &asset, Address const &target,
        byte_string_view const input, uint64_t const offset)
    {
        AbiEncoder encoder;
        encoder.add_address(asset);
        encoder.add_address(target);
        encoder.add_bytes(input);
        encoder.add_uint(u256_be{offset});
        encoder.add_bytes32(placeholder);
        return abi_encode_call(selector, encoder.encode_final());
    }

    byte_string text(std::string_view const s)
    {
        return byte_string{
            reinterpret_cast<uint8_t const *>(s.data()), s.size()};
    }
}

struct InjectionRouterTest : public ::testing::Test
{
    Ledger ledger;
    std::shared_ptr<Recorder> recorder{std::make_shared<Recorder>()};

    void SetUp() override
    {
        ledger.set_code(INJECTION_ROUTER_CA, std::make_shared<InjectionRouter>());
        ledger.set_code(TOKEN, std::make_shared<FungibleAsset>(MINTER));
        ledger.set_code(RECORDER, recorder);
        ledger.set_code(LOCKED, std::make_shared<LockedAsset>());
        ledger.add_to_balance(user, 10'000);
    }

    ExecutionResult send(
        Address const &sender, Address const &to, byte_string data,
        uint256_t const &value = 0)
    {
        return execute_transaction(
            ledger,
            Transaction{
                .sender = sender,
                .to = to,
                .value = value,
                .data = std::move(data)});
    }

    uint256_t query(uint32_t const selector, byte_string_view const args)
    {
        State state{ledger};
        Host host{state, user};
        auto const input = abi_encode_call(selector, args);
        auto const result = host.call(evmc_message{
            .kind = EVMC_CALL,
            .flags = EVMC_STATIC,
            .gas = 100'000,
            .recipient = TOKEN,
            .sender = user,
            .input_data = input.data(),
            .input_size = input.size(),
            .code_address = TOKEN,
        });
        EXPECT_EQ(result.status_code, EVMC_SUCCESS);
        return intx::be::unsafe::load<uint256_t>(result.output_data);
    }

    uint256_t token_balance(Address const &a)
    {
        AbiEncoder encoder;
        encoder.add_address(a);
        return query(
            abi_encode_selector("balanceOf(address)"), encoder.encode_final());
    }
};

TEST_F(InjectionRouterTest, native_value_is_injected_and_forwarded)
{
    auto const result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(INJECT_AND_CALL, NATIVE_ASSET, RECORDER, recorder_input(), 4),
        700);
    ASSERT_EQ(result.receipt.status, 1);
    EXPECT_EQ(result.output, text("ok"));

    EXPECT_EQ(recorder->value, 700);
    ASSERT_EQ(recorder->input.size(), 4 + 32 + 2);
    EXPECT_EQ(recorder->input.substr(0, 4), (byte_string{0x01, 0x02, 0x03, 0x04}));
    EXPECT_EQ(
        intx::be::unsafe::load<uint256_t>(recorder->input.data() + 4), 700);
    EXPECT_EQ(recorder->input.substr(36), (byte_string{0xaa, 0xbb}));
    EXPECT_EQ(ledger.get_balance(RECORDER), 700);
    EXPECT_EQ(ledger.get_balance(INJECTION_ROUTER_CA), 0);

    ASSERT_EQ(result.receipt.logs.size(), 1);
    auto const &log = result.receipt.logs[0];
    EXPECT_EQ(log.address, INJECTION_ROUTER_CA);
    ASSERT_EQ(log.topics.size(), 4);
    EXPECT_EQ(log.topics[0], AMOUNT_INJECTED_EVENT);
    EXPECT_EQ(log.topics[1], abi_encode_address(NATIVE_ASSET));
    EXPECT_EQ(log.topics[2], abi_encode_address(RECORDER));
    EXPECT_EQ(log.topics[3], placeholder);
    // amount, offset, success
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(log.data.data()), 700);
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(log.data.data() + 32), 4);
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(log.data.data() + 64), 1);
}

TEST_F(InjectionRouterTest, fungible_amount_is_approved_not_sent)
{
    ASSERT_EQ(
        send(MINTER, TOKEN, token_call(MINT, INJECTION_ROUTER_CA, 42))
            .receipt.status,
        1);

    auto const result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(INJECT_AND_CALL, TOKEN, RECORDER, recorder_input(), 4));
    ASSERT_EQ(result.receipt.status, 1);

    EXPECT_EQ(recorder->value, 0);
    EXPECT_EQ(
        intx::be::unsafe::load<uint256_t>(recorder->input.data() + 4), 42);

    AbiEncoder encoder;
    encoder.add_address(INJECTION_ROUTER_CA);
    encoder.add_address(RECORDER);
    EXPECT_EQ(
        query(abi_encode_selector("allowance(address,address)"),
              encoder.encode_final()),
        42);
    EXPECT_EQ(token_balance(INJECTION_ROUTER_CA), 42);
}

TEST_F(InjectionRouterTest, sweep_variant_pulls_from_caller)
{
    ASSERT_EQ(
        send(MINTER, TOKEN, token_call(MINT, user, 90)).receipt.status, 1);
    ASSERT_EQ(
        send(user, TOKEN, token_call(APPROVE, INJECTION_ROUTER_CA, 1'000))
            .receipt.status,
        1);

    // the token itself is the target: transfer(payee, <amount>)
    byte_string input = token_call(TRANSFER, payee, 0);
    input.replace(36, 32, placeholder.bytes, 32);

    auto const result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(INJECT_SWEEP_AND_CALL, TOKEN, TOKEN, input, 36));
    ASSERT_EQ(result.receipt.status, 1);

    EXPECT_EQ(token_balance(user), 0);
    EXPECT_EQ(token_balance(INJECTION_ROUTER_CA), 0);
    EXPECT_EQ(token_balance(payee), 90);
}

TEST_F(InjectionRouterTest, nothing_to_inject)
{
    auto const result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(INJECT_AND_CALL, TOKEN, RECORDER, recorder_input(), 4));
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, text("no value available"));
    EXPECT_TRUE(recorder->input.empty());
}

TEST_F(InjectionRouterTest, offset_and_placeholder_checks)
{
    // 38 byte input, a word at 7 would end at 39
    auto result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(INJECT_AND_CALL, NATIVE_ASSET, RECORDER, recorder_input(), 7),
        1);
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, text("amount offset out of bounds"));

    result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(
            INJECT_AND_CALL,
            NATIVE_ASSET,
            RECORDER,
            recorder_input(),
            uint64_t{1} << 40),
        1);
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, text("amount offset out of bounds"));

    result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(INJECT_AND_CALL, NATIVE_ASSET, RECORDER, recorder_input(), 6),
        1);
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, text("placeholder mismatch"));
    EXPECT_TRUE(recorder->input.empty());
    EXPECT_EQ(ledger.get_balance(user), 10'000);
}

TEST_F(InjectionRouterTest, target_failure_is_wrapped)
{
    auto const result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(
            INJECT_AND_CALL, NATIVE_ASSET, RECORDER, recorder_input(FAIL), 4),
        5);
    EXPECT_EQ(result.receipt.status, 0);

    AbiEncoder encoder;
    encoder.add_bytes(byte_string{'n', 'o', 'p', 'e'});
    EXPECT_EQ(
        result.output,
        abi_encode_call(TARGET_CALL_FAILED, encoder.encode_final()));
    EXPECT_EQ(ledger.get_balance(user), 10'000);
}

TEST_F(InjectionRouterTest, approval_failure_bubbles_the_asset_payload)
{
    auto const result = send(
        user,
        INJECTION_ROUTER_CA,
        router_call(INJECT_AND_CALL, LOCKED, RECORDER, recorder_input(), 4));
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, text("locked"));
    EXPECT_TRUE(recorder->input.empty());
}

TEST_F(InjectionRouterTest, unknown_selector)
{
    auto const result = send(
        user, INJECTION_ROUTER_CA, byte_string{0x12, 0x34, 0x56, 0x78});
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, text("method not supported"));
}
