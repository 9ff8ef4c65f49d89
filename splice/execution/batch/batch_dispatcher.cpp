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
#include <splice/core/int.hpp>
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/batch/batch_dispatcher.hpp>
#include <splice/execution/batch/batch_error.hpp>
#include <splice/execution/batch/call_batch.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

evmc_message to_message(
    ExecutionFrame const &frame, CallDescriptor const &call,
    int64_t const gas)
{
    if (!call.context_preserving) {
        return make_call_message(
            frame, call.target, call.native_amount, call.input, gas);
    }
    // runs the target's code over the storage and balance of the owner
    return evmc_message{
        .kind = EVMC_DELEGATECALL,
        .flags = frame.flags,
        .depth = frame.depth + 1,
        .gas = gas,
        .recipient = frame.storage_owner,
        .sender = frame.caller,
        .input_data = call.input.data(),
        .input_size = call.input.size(),
        .value = intx::be::store<evmc::uint256be>(frame.value),
        .create2_salt = {},
        .code_address = call.target,
        .code = nullptr,
        .code_size = 0,
    };
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

Result<std::vector<CallResult>> dispatch_batch(
    Host &host, ExecutionFrame &frame, CallBatch const &calls)
{
    std::vector<CallResult> results(calls.size());
    bool ignored_failure = false;

    for (size_t i = 0; i < calls.size(); ++i) {
        auto const &call = calls[i];

        // the flag only ever covers the call right after the failure
        bool const previous_ignored = std::exchange(ignored_failure, false);
        if (call.fallback_only && !previous_ignored) {
            continue;
        }

        auto const available = static_cast<uint64_t>(frame.gas_left);
        if (SPLICE_UNLIKELY(call.budget_cap > available)) {
            LOG_WARNING(
                "call {} budget {} exceeds remaining gas {}",
                i,
                call.budget_cap,
                available);
            return BatchError::InsufficientBudget;
        }
        int64_t const gas = call.budget_cap == 0
                                ? frame.gas_left
                                : static_cast<int64_t>(call.budget_cap);

        auto const msg = to_message(frame, call, gas);
        auto const result = host.call(msg);
        frame.consume_gas(gas, result.gas_left);

        results[i].output.assign(result.output_data, result.output_size);
        if (result.status_code == EVMC_SUCCESS) {
            results[i].status = CallStatus::Succeeded;
            continue;
        }

        results[i].status = CallStatus::Failed;
        switch (call.error_policy) {
        case ErrorPolicy::Revert:
            LOG_WARNING("call {} to {} reverted the batch", i, call.target);
            return BatchError::SubCallReverted;
        case ErrorPolicy::Abort:
            LOG_DEBUG("call {} to {} failed, batch aborted", i, call.target);
            return results;
        case ErrorPolicy::Ignore:
            ignored_failure = true;
            break;
        case ErrorPolicy::Fallthrough:
            break;
        }
    }

    return results;
}

SPLICE_NAMESPACE_END
