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

#include <splice/core/assert.h>
#include <splice/core/byte_string.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/batch/batch_error.hpp>
#include <splice/execution/batch/call_batch.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/packed_decode.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

template <typename T>
Result<T> read(byte_string_view &enc)
{
    return decode_packed<T>(enc, BatchError::TruncatedBatch);
}

Result<CallDescriptor> decode_call(byte_string_view &enc)
{
    using namespace call_flags;

    BOOST_OUTCOME_TRY(auto const flags, read<uint8_t>(enc));
    if (SPLICE_UNLIKELY(flags & RESERVED)) {
        LOG_WARNING("call flags 0x{:02x} set reserved bits", flags);
        return BatchError::InvalidCallFlags;
    }

    CallDescriptor call{
        .context_preserving = (flags & CONTEXT_PRESERVING) != 0,
        .fallback_only = (flags & FALLBACK_ONLY) != 0,
        .error_policy =
            static_cast<ErrorPolicy>((flags & POLICY_MASK) >> POLICY_SHIFT),
    };

    BOOST_OUTCOME_TRY(call.target, read<Address>(enc));
    if (flags & HAS_VALUE) {
        BOOST_OUTCOME_TRY(auto const value, read<u256_be>(enc));
        call.native_amount = value.native();
    }
    if (flags & HAS_BUDGET) {
        BOOST_OUTCOME_TRY(auto const budget, read<u256_be>(enc));
        call.budget_cap = budget.native();
    }
    BOOST_OUTCOME_TRY(auto const length, read<u32_be>(enc));
    BOOST_OUTCOME_TRY(
        auto const input,
        decode_packed_bytes(enc, length.native(), BatchError::TruncatedBatch));
    call.input = byte_string{input};
    return call;
}

void append_be(byte_string &out, auto const &be)
{
    out.append(be.bytes, sizeof(be.bytes));
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

Result<CallBatch> decode_call_batch(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const count, read<uint8_t>(enc));

    CallBatch calls;
    calls.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(auto call, decode_call(enc));
        calls.push_back(std::move(call));
    }

    if (SPLICE_UNLIKELY(!enc.empty())) {
        return BatchError::TrailingBytes;
    }
    return calls;
}

byte_string encode_call_batch(CallBatch const &calls)
{
    using namespace call_flags;

    SPLICE_ASSERT(calls.size() <= MAX_BATCH_CALLS);

    byte_string out;
    out.push_back(static_cast<uint8_t>(calls.size()));
    for (auto const &call : calls) {
        uint8_t flags = static_cast<uint8_t>(
            static_cast<uint8_t>(call.error_policy) << POLICY_SHIFT);
        if (call.context_preserving) {
            flags |= CONTEXT_PRESERVING;
        }
        if (call.fallback_only) {
            flags |= FALLBACK_ONLY;
        }
        if (call.native_amount != 0) {
            flags |= HAS_VALUE;
        }
        if (call.budget_cap != 0) {
            flags |= HAS_BUDGET;
        }

        out.push_back(flags);
        out.append(call.target.bytes, sizeof(call.target.bytes));
        if (call.native_amount != 0) {
            append_be(out, u256_be{call.native_amount});
        }
        if (call.budget_cap != 0) {
            append_be(out, u256_be{call.budget_cap});
        }
        SPLICE_ASSERT(
            call.input.size() <= std::numeric_limits<uint32_t>::max());
        append_be(out, u32_be{static_cast<uint32_t>(call.input.size())});
        out += call.input;
    }
    return out;
}

byte_string encode_call_results(std::vector<CallResult> const &results)
{
    SPLICE_ASSERT(results.size() <= MAX_BATCH_CALLS);

    byte_string out;
    out.push_back(static_cast<uint8_t>(results.size()));
    for (auto const &result : results) {
        out.push_back(static_cast<uint8_t>(result.status));
        append_be(out, u32_be{static_cast<uint32_t>(result.output.size())});
        out += result.output;
    }
    return out;
}

Result<std::vector<CallResult>> decode_call_results(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const count, read<uint8_t>(enc));

    std::vector<CallResult> results;
    results.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(auto const status, read<uint8_t>(enc));
        if (SPLICE_UNLIKELY(status > static_cast<uint8_t>(CallStatus::Skipped))) {
            return BatchError::InvalidCallFlags;
        }
        BOOST_OUTCOME_TRY(auto const length, read<u32_be>(enc));
        BOOST_OUTCOME_TRY(
            auto const output,
            decode_packed_bytes(
                enc, length.native(), BatchError::TruncatedBatch));
        results.push_back(CallResult{
            .status = static_cast<CallStatus>(status),
            .output = byte_string{output},
        });
    }

    if (SPLICE_UNLIKELY(!enc.empty())) {
        return BatchError::TrailingBytes;
    }
    return results;
}

SPLICE_NAMESPACE_END
