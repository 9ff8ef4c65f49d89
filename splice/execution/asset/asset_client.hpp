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

#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;

// Calls made on behalf of the code running in a frame. An asset is either
// NATIVE_ASSET or the address of a contract answering the ERC-20 methods.
// Outgoing calls are paid from the frame's gas.

Result<uint256_t> query_balance(
    Host &, ExecutionFrame &, Address const &asset, Address const &account);

Result<uint256_t> query_allowance(
    Host &, ExecutionFrame &, Address const &asset, Address const &owner,
    Address const &spender);

// Sends `amount` of `asset` from the storage owner.
Result<void> transfer_asset(
    Host &, ExecutionFrame &, Address const &asset, Address const &to,
    uint256_t const &amount);

// Pulls `amount` of a fungible asset from `from`, which must have approved
// the storage owner.
Result<void> transfer_asset_from(
    Host &, ExecutionFrame &, Address const &asset, Address const &from,
    Address const &to, uint256_t const &amount);

Result<void> approve_asset(
    Host &, ExecutionFrame &, Address const &asset, Address const &spender,
    uint256_t const &amount);

SPLICE_NAMESPACE_END
