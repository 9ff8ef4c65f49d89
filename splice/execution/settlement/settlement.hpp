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

#include <splice/core/bytes.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;

// Transient storage key of the success sentinel for `op_hash`.
bytes32_t sentinel_slot(bytes32_t const &op_hash);

// Moves assets out of the storage owner of `frame` at the end of a batch.
// Amounts are taken from the owner's live balance when the primitive runs.
// Events are emitted by the storage owner.
class Settlement
{
    Host &host_;
    ExecutionFrame &frame_;

    Result<void> pay(
        Address const &asset, Address const &to, uint256_t const &amount);
    void emit_sweep(
        Address const &asset, Address const &recipient,
        uint256_t const &amount);

public:
    struct RefundOutcome
    {
        uint256_t refunded;
        uint256_t remaining;
    };

    Settlement(Host &, ExecutionFrame &);

    // Sends min(balance, cap) and returns it. A zero amount moves nothing but
    // still emits Sweep.
    Result<uint256_t> sweep(
        Address const &asset, Address const &recipient,
        uint256_t const &cap = UINT256_MAX);

    Result<RefundOutcome> refund_and_sweep(
        Address const &asset, Address const &refund_recipient,
        uint256_t const &refund_cap, Address const &sweep_recipient);

    void record_success(bytes32_t const &op_hash);
    Result<void> require_success(bytes32_t const &op_hash);

    Result<uint256_t> validate_op_hash_and_sweep(
        bytes32_t const &op_hash, Address const &asset,
        Address const &recipient);
};

SPLICE_NAMESPACE_END
