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

#pragma once

#include <splice/core/byte_string.hpp>
#include <splice/core/bytes.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/contract/storage_variable.hpp>
#include <splice/execution/host/contract.hpp>

#include <evmc/evmc.hpp>

#include <bit>
#include <cstdint>
#include <utility>

SPLICE_NAMESPACE_BEGIN

class State;
struct ExecutionFrame;

// ERC-20 shaped token. Balances, allowances and the total supply live in the
// storage of the address the contract is deployed at. Only the minter given
// at deployment can create new units.
class FungibleAsset : public NativeContract
{
    Address const minter_;

    class Variables
    {
        State &state_;
        Address const &self_;

        static constexpr auto AddressTotalSupply{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

        enum Namespace : uint8_t
        {
            NSBalance = 0x01,
            NSAllowance = 0x02,
        };

    public:
        Variables(State &state, Address const &self)
            : state_{state}
            , self_{self}
        {
        }

        StorageVariable<u256_be> total_supply{
            state_, self_, AddressTotalSupply};

        // mapping (address => uint256) balance
        StorageVariable<u256_be> balance(Address const &owner) noexcept
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = NSBalance, .address = owner, .slots = {}};

            return {state_, self_, std::bit_cast<bytes32_t>(key)};
        }

        // mapping (address => mapping (address => uint256)) allowance
        StorageVariable<u256_be>
        allowance(Address const &owner, Address const &spender);
    };

    void emit_transfer_event(
        State &, Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount);
    void emit_approval_event(
        State &, Address const &asset, Address const &owner,
        Address const &spender, uint256_t const &amount);

    Result<void> move_balance(
        Variables &, Address const &from, Address const &to,
        uint256_t const &amount);

public:
    explicit FungibleAsset(Address const &minter);

    using PrecompileFunc = Result<byte_string> (FungibleAsset::*)(
        State &, ExecutionFrame const &, byte_string_view);

    static std::pair<PrecompileFunc, uint64_t> dispatch(byte_string_view &);

    evmc::Result execute(Host &, evmc_message const &) override;

    Result<byte_string>
    balance_of(State &, ExecutionFrame const &, byte_string_view);
    Result<byte_string>
    allowance(State &, ExecutionFrame const &, byte_string_view);
    Result<byte_string>
    total_supply(State &, ExecutionFrame const &, byte_string_view);
    Result<byte_string>
    transfer(State &, ExecutionFrame const &, byte_string_view);
    Result<byte_string>
    approve(State &, ExecutionFrame const &, byte_string_view);
    Result<byte_string>
    transfer_from(State &, ExecutionFrame const &, byte_string_view);
    Result<byte_string> mint(State &, ExecutionFrame const &, byte_string_view);
    Result<byte_string>
    fallback(State &, ExecutionFrame const &, byte_string_view);
};

SPLICE_NAMESPACE_END
