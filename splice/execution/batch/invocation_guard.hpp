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
#include <splice/core/result.hpp>
#include <splice/execution/batch/call_batch.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/error_operand.hpp>

SPLICE_NAMESPACE_BEGIN

struct ExecutionFrame;

// Restricts invocation modes by whether the code runs in its own account or
// in one that lent its storage through a delegate call.
class InvocationGuard
{
    Address const canonical_;

public:
    explicit InvocationGuard(Address const &canonical)
        : canonical_{canonical}
    {
    }

    bool is_borrowed(ExecutionFrame const &) const;

    // NotDelegateCall unless the storage owner is some account other than
    // the canonical deployment.
    Result<void> require_borrowed(ExecutionFrame const &) const;

    // DelegateCallNotAllowed if any context preserving call is requested
    // while not borrowed. Checked for every call before any is dispatched.
    // The offending call index goes to `operand`.
    Result<void> check_batch(
        ExecutionFrame const &, CallBatch const &,
        ErrorOperand *operand = nullptr) const;
};

SPLICE_NAMESPACE_END
