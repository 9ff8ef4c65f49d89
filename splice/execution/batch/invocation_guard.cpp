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

#include <splice/core/config.hpp>
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/batch/call_batch.hpp>
#include <splice/execution/batch/invocation_error.hpp>
#include <splice/execution/batch/invocation_guard.hpp>
#include <splice/execution/core/error_operand.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/host/execution_frame.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

#include <cstddef>

SPLICE_NAMESPACE_BEGIN

bool InvocationGuard::is_borrowed(ExecutionFrame const &frame) const
{
    return frame.storage_owner != canonical_;
}

Result<void>
InvocationGuard::require_borrowed(ExecutionFrame const &frame) const
{
    if (SPLICE_UNLIKELY(!is_borrowed(frame))) {
        LOG_WARNING(
            "direct call to {} from {} requires a delegate call",
            canonical_,
            frame.caller);
        return InvocationError::NotDelegateCall;
    }
    return outcome::success();
}

Result<void> InvocationGuard::check_batch(
    ExecutionFrame const &frame, CallBatch const &calls,
    ErrorOperand *const operand) const
{
    if (is_borrowed(frame)) {
        return outcome::success();
    }
    for (size_t i = 0; i < calls.size(); ++i) {
        if (SPLICE_UNLIKELY(calls[i].context_preserving)) {
            LOG_WARNING(
                "call {} requests a delegate call outside a borrowed frame",
                i);
            record_operand(operand, i);
            return InvocationError::DelegateCallNotAllowed;
        }
    }
    return outcome::success();
}

SPLICE_NAMESPACE_END
