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
#include <splice/execution/asset/asset_call_error.hpp>
#include <splice/execution/asset/asset_client.hpp>
#include <splice/execution/asset/asset_error.hpp>
#include <splice/execution/asset/fungible_asset.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_decode_error.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/module/constants.hpp>
#include <splice/execution/state/ledger.hpp>
#include <splice/execution/state/state.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <memory>

using namespace splice;

namespace
{
    constexpr auto TOKEN = 0x00000000000000000000000000000000000a55e7_address;
    constexpr auto MINTER = 0x000000000000000000000000000000000000beef_address;
    constexpr auto alice = 0xa11ce00000000000000000000000000000000001_address;
    constexpr auto bob = 0xb0b0000000000000000000000000000000000002_address;
    constexpr auto carol = 0xca40100000000000000000000000000000000003_address;

    byte_string transfer_args(Address const &to, uint256_t const &amount)
    {
        AbiEncoder encoder;
        encoder.add_address(to);
        encoder.add_uint(u256_be{amount});
        return encoder.encode_final();
    }

    byte_string transfer_from_args(
        Address const &from, Address const &to, uint256_t const &amount)
    {
        AbiEncoder encoder;
        encoder.add_address(from);
        encoder.add_address(to);
        encoder.add_uint(u256_be{amount});
        return encoder.encode_final();
    }

    byte_string address_args(Address const &a)
    {
        AbiEncoder encoder;
        encoder.add_address(a);
        return encoder.encode_final();
    }

    uint256_t decode_word(byte_string const &output)
    {
        EXPECT_EQ(output.size(), 32);
        return intx::be::unsafe::load<uint256_t>(output.data());
    }
}

struct FungibleAssetTest : public ::testing::Test
{
    Ledger ledger;
    std::shared_ptr<FungibleAsset> asset{
        std::make_shared<FungibleAsset>(MINTER)};
    State state{ledger};

    void SetUp() override
    {
        ledger.set_code(TOKEN, asset);
    }

    ExecutionFrame frame_for(Address const &caller, uint256_t value = 0)
    {
        return ExecutionFrame{
            .storage_owner = TOKEN,
            .code_identity = TOKEN,
            .caller = caller,
            .origin = caller,
            .value = value,
            .depth = 0,
            .gas_left = 1'000'000,
            .flags = 0,
        };
    }

    uint256_t balance_of(Address const &owner)
    {
        auto const res =
            asset->balance_of(state, frame_for(owner), address_args(owner));
        EXPECT_TRUE(res.has_value());
        return decode_word(res.value());
    }

    void mint(Address const &to, uint256_t const &amount)
    {
        state.push();
        auto const res =
            asset->mint(state, frame_for(MINTER), transfer_args(to, amount));
        ASSERT_FALSE(res.has_error());
        state.pop_accept();
    }
};

TEST_F(FungibleAssetTest, mint_only_by_minter)
{
    auto const res =
        asset->mint(state, frame_for(alice), transfer_args(alice, 100));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::NotMinter);

    mint(alice, 100);
    EXPECT_EQ(balance_of(alice), 100);

    auto const supply =
        asset->total_supply(state, frame_for(alice), byte_string_view{});
    ASSERT_TRUE(supply.has_value());
    EXPECT_EQ(decode_word(supply.value()), 100);
}

TEST_F(FungibleAssetTest, transfer_moves_balance_and_logs)
{
    mint(alice, 100);

    state.push();
    auto const res =
        asset->transfer(state, frame_for(alice), transfer_args(bob, 40));
    ASSERT_TRUE(res.has_value());
    state.pop_accept();

    EXPECT_EQ(balance_of(alice), 60);
    EXPECT_EQ(balance_of(bob), 40);

    // mint and transfer
    ASSERT_EQ(state.logs().size(), 2);
    auto const &log = state.logs().back();
    EXPECT_EQ(log.address, TOKEN);
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(log.topics[1], abi_encode_address(alice));
    EXPECT_EQ(log.topics[2], abi_encode_address(bob));
}

TEST_F(FungibleAssetTest, transfer_insufficient_balance)
{
    mint(alice, 10);
    auto const res =
        asset->transfer(state, frame_for(alice), transfer_args(bob, 11));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientBalance);
}

TEST_F(FungibleAssetTest, transfer_from_spends_allowance)
{
    mint(alice, 100);

    state.push();
    ASSERT_TRUE(
        asset->approve(state, frame_for(alice), transfer_args(bob, 30))
            .has_value());

    auto res = asset->transfer_from(
        state, frame_for(bob), transfer_from_args(alice, carol, 31));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientAllowance);

    res = asset->transfer_from(
        state, frame_for(bob), transfer_from_args(alice, carol, 30));
    ASSERT_TRUE(res.has_value());
    state.pop_accept();

    EXPECT_EQ(balance_of(alice), 70);
    EXPECT_EQ(balance_of(carol), 30);

    byte_string args = address_args(alice);
    args += address_args(bob);
    auto const allowance = asset->allowance(state, frame_for(bob), args);
    ASSERT_TRUE(allowance.has_value());
    EXPECT_EQ(decode_word(allowance.value()), 0);
}

TEST_F(FungibleAssetTest, unlimited_allowance_is_not_drawn_down)
{
    mint(alice, 100);
    ASSERT_TRUE(asset
                    ->approve(
                        state,
                        frame_for(alice),
                        transfer_args(bob, std::numeric_limits<uint256_t>::max()))
                    .has_value());
    ASSERT_TRUE(asset
                    ->transfer_from(
                        state, frame_for(bob), transfer_from_args(alice, bob, 5))
                    .has_value());

    byte_string args = address_args(alice);
    args += address_args(bob);
    auto const allowance = asset->allowance(state, frame_for(bob), args);
    ASSERT_TRUE(allowance.has_value());
    EXPECT_EQ(
        decode_word(allowance.value()), std::numeric_limits<uint256_t>::max());
}

TEST_F(FungibleAssetTest, rejects_value_and_static_writes)
{
    mint(alice, 100);

    auto res =
        asset->transfer(state, frame_for(alice, 1), transfer_args(bob, 1));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::ValueNonZero);

    auto frame = frame_for(alice);
    frame.flags = EVMC_STATIC;
    res = asset->transfer(state, frame, transfer_args(bob, 1));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::StaticModeViolation);
}

TEST_F(FungibleAssetTest, invalid_input)
{
    auto res = asset->balance_of(state, frame_for(alice), byte_string_view{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AbiDecodeError::InputTooShort);

    byte_string too_long = address_args(alice);
    too_long += address_args(bob);
    res = asset->balance_of(state, frame_for(alice), too_long);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InvalidInput);
}

TEST_F(FungibleAssetTest, unknown_selector_reverts)
{
    Host host{state, alice};
    byte_string const input{0xde, 0xad, 0xbe, 0xef};
    auto const result = host.call(evmc_message{
        .kind = EVMC_CALL,
        .gas = 100'000,
        .recipient = TOKEN,
        .sender = alice,
        .input_data = input.data(),
        .input_size = input.size(),
        .code_address = TOKEN,
    });
    EXPECT_EQ(result.status_code, EVMC_REVERT);
}

TEST_F(FungibleAssetTest, client_queries_and_transfers)
{
    mint(alice, 100);
    Host host{state, alice};
    auto frame = frame_for(alice);
    frame.storage_owner = alice;
    frame.code_identity = alice;

    auto const balance = query_balance(host, frame, TOKEN, alice);
    ASSERT_TRUE(balance.has_value());
    EXPECT_EQ(balance.value(), 100);
    EXPECT_LT(frame.gas_left, 1'000'000);

    state.push();
    ASSERT_FALSE(transfer_asset(host, frame, TOKEN, bob, 25).has_error());
    state.pop_accept();
    EXPECT_EQ(balance_of(bob), 25);

    auto const failed = transfer_asset(host, frame, TOKEN, bob, 1'000);
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.assume_error(), AssetCallError::AssetTransferFailed);
    EXPECT_FALSE(host.return_data().empty());
}

TEST_F(FungibleAssetTest, client_query_on_codeless_account_fails)
{
    Host host{state, alice};
    auto frame = frame_for(alice);
    auto const balance = query_balance(host, frame, carol, alice);
    ASSERT_TRUE(balance.has_error());
    EXPECT_EQ(balance.assume_error(), AssetCallError::AssetQueryFailed);
}

TEST_F(FungibleAssetTest, client_native_balance_and_transfer)
{
    ledger.add_to_balance(alice, 500);
    State s{ledger};
    Host host{s, alice};
    auto frame = frame_for(alice);
    frame.storage_owner = alice;

    auto const balance = query_balance(host, frame, NATIVE_ASSET, alice);
    ASSERT_TRUE(balance.has_value());
    EXPECT_EQ(balance.value(), 500);

    s.push();
    ASSERT_FALSE(
        transfer_asset(host, frame, NATIVE_ASSET, bob, 200).has_error());
    s.pop_accept();
    EXPECT_EQ(intx::be::load<uint256_t>(s.get_balance(bob)), 200);

    // the asset contract refuses native value
    auto const rejected = transfer_asset(host, frame, NATIVE_ASSET, TOKEN, 1);
    ASSERT_TRUE(rejected.has_error());
    EXPECT_EQ(rejected.assume_error(), AssetCallError::NativeTransferFailed);
}
