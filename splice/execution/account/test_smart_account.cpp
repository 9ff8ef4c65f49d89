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
#include <splice/core/int.hpp>
#include <splice/execution/account/smart_account.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/host/contract.hpp>
#include <splice/execution/host/execute_transaction.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/state/ledger.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string_view>

using namespace splice;

namespace
{
    constexpr auto MODULE = 0x000000000000000000000000000000000000d0d0_address;
    constexpr auto WALLET = 0x000000000000000000000000000000000000a11e_address;
    constexpr auto alice = 0xa11ce00000000000000000000000000000000001_address;
    constexpr auto bob = 0xb0b0000000000000000000000000000000000002_address;
    constexpr auto slot =
        0x0000000000000000000000000000000000000000000000000000000000000007_bytes32;
    constexpr auto marker =
        0x00000000000000000000000000000000000000000000000000000000000000bb_bytes32;

    constexpr uint32_t EXECUTE =
        abi_encode_selector("execute(address,uint256,bytes)");
    constexpr uint32_t EXECUTE_DELEGATE =
        abi_encode_selector("executeDelegate(address,bytes)");
    constexpr uint32_t OWNER = abi_encode_selector("owner()");

    // Marks the storage it runs over and echoes its input, reverting when
    // the input starts with 0xff.
    struct Marker : public NativeContract
    {
        evmc::Result execute(Host &host, evmc_message const &msg) override
        {
            host.state().set_storage(msg.recipient, slot, marker);
            byte_string_view const input{msg.input_data, msg.input_size};
            if (!input.empty() && input[0] == 0xff) {
                return make_revert_result(input, msg.gas);
            }
            return make_success_result(input, msg.gas);
        }
    };

    byte_string delegate_call(Address const &module, byte_string_view data)
    {
        AbiEncoder encoder;
        encoder.add_address(module);
        encoder.add_bytes(data);
        return abi_encode_call(EXECUTE_DELEGATE, encoder.encode_final());
    }

    byte_string as_bytes(std::string_view const s)
    {
        return byte_string{
            reinterpret_cast<uint8_t const *>(s.data()), s.size()};
    }
}

struct SmartAccountTest : public ::testing::Test
{
    Ledger ledger;

    void SetUp() override
    {
        ledger.set_code(MODULE, std::make_shared<Marker>());
        ledger.set_code(WALLET, std::make_shared<SmartAccount>(alice));
        ledger.add_to_balance(alice, 1'000);
    }
};

TEST_F(SmartAccountTest, calls_out_as_itself)
{
    ledger.add_to_balance(WALLET, 50);

    AbiEncoder encoder;
    encoder.add_address(bob);
    encoder.add_uint(u256_be{20});
    encoder.add_bytes(byte_string{});
    auto const result = execute_transaction(
        ledger,
        Transaction{
            .sender = alice,
            .to = WALLET,
            .data = abi_encode_call(EXECUTE, encoder.encode_final())});
    ASSERT_EQ(result.receipt.status, 1);
    EXPECT_EQ(ledger.get_balance(bob), 20);
    EXPECT_EQ(ledger.get_balance(WALLET), 30);
}

TEST_F(SmartAccountTest, owner_and_receive)
{
    auto const owner = execute_transaction(
        ledger,
        Transaction{
            .sender = bob,
            .to = WALLET,
            .data = abi_encode_call(OWNER, byte_string_view{})});
    ASSERT_EQ(owner.receipt.status, 1);
    auto const word = abi_encode_address(alice);
    EXPECT_EQ(owner.output, (byte_string{word.bytes, sizeof(word.bytes)}));

    auto const received = execute_transaction(
        ledger, Transaction{.sender = alice, .to = WALLET, .value = 7});
    ASSERT_EQ(received.receipt.status, 1);
    EXPECT_EQ(ledger.get_balance(WALLET), 7);
}

TEST_F(SmartAccountTest, lends_its_storage)
{
    auto const result = execute_transaction(
        ledger,
        Transaction{
            .sender = alice,
            .to = WALLET,
            .data = delegate_call(MODULE, byte_string{0x42})});
    ASSERT_EQ(result.receipt.status, 1);
    EXPECT_EQ(result.output, byte_string{0x42});
    EXPECT_EQ(ledger.get_storage(WALLET, slot), marker);
    EXPECT_EQ(ledger.get_storage(MODULE, slot), bytes32_t{});
}

TEST_F(SmartAccountTest, inner_failure_is_bubbled)
{
    auto const result = execute_transaction(
        ledger,
        Transaction{
            .sender = alice,
            .to = WALLET,
            .data = delegate_call(MODULE, byte_string{0xff, 0x09})});
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, (byte_string{0xff, 0x09}));
    EXPECT_EQ(ledger.get_storage(WALLET, slot), bytes32_t{});
}

TEST_F(SmartAccountTest, only_the_owner_may_call_out)
{
    auto const result = execute_transaction(
        ledger,
        Transaction{
            .sender = bob,
            .to = WALLET,
            .data = delegate_call(MODULE, byte_string{0x42})});
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, as_bytes("caller is not the owner"));
    EXPECT_EQ(ledger.get_storage(WALLET, slot), bytes32_t{});
}

TEST_F(SmartAccountTest, unknown_selector)
{
    auto const result = execute_transaction(
        ledger,
        Transaction{
            .sender = alice,
            .to = WALLET,
            .data = abi_encode_call(0xdeadbeef, byte_string_view{})});
    EXPECT_EQ(result.receipt.status, 0);
    EXPECT_EQ(result.output, as_bytes("method not supported"));
}
