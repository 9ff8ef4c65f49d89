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

#include <splice/core/assert.h>
#include <splice/core/byte_string.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/error_operand.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <cstdint>

SPLICE_NAMESPACE_BEGIN

// The environment a piece of code observes while it runs. Under a delegate
// call `storage_owner` is the account that lent its identity, storage and
// balance; `code_identity` is the account the code was deployed at.
struct ExecutionFrame
{
    Address storage_owner{};
    Address code_identity{};
    Address caller{};
    Address origin{};
    uint256_t value{0};
    int32_t depth{0};
    int64_t gas_left{0};
    uint32_t flags{0};
    // set when the code fails with a parameterised error
    ErrorOperand error_operand{};

    static ExecutionFrame
    from_message(evmc_message const &msg, Address const &origin)
    {
        return ExecutionFrame{
            .storage_owner = msg.recipient,
            .code_identity = msg.code_address,
            .caller = msg.sender,
            .origin = origin,
            .value = intx::be::load<uint256_t>(msg.value),
            .depth = msg.depth,
            .gas_left = msg.gas,
            .flags = msg.flags,
        };
    }

    bool is_static() const
    {
        return (flags & EVMC_STATIC) != 0;
    }

    void consume_gas(int64_t const given, int64_t const returned)
    {
        SPLICE_ASSERT(given >= returned && given <= gas_left);
        gas_left -= given - returned;
    }
};

// Message for a plain call made by the code running in `frame`. The callee
// sees the storage owner as its caller.
inline evmc_message make_call_message(
    ExecutionFrame const &frame, Address const &target,
    uint256_t const &value, byte_string_view const input, int64_t const gas,
    uint32_t const extra_flags = 0)
{
    return evmc_message{
        .kind = EVMC_CALL,
        .flags = frame.flags | extra_flags,
        .depth = frame.depth + 1,
        .gas = gas,
        .recipient = target,
        .sender = frame.storage_owner,
        .input_data = input.data(),
        .input_size = input.size(),
        .value = intx::be::store<evmc::uint256be>(value),
        .create2_salt = {},
        .code_address = target,
        .code = nullptr,
        .code_size = 0,
    };
}

SPLICE_NAMESPACE_END
