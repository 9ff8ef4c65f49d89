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
#include <splice/core/bytes.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/batch/call_batch.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <splice/execution/hydration/hydration_error.hpp>
#include <splice/execution/hydration/hydration_interpreter.hpp>
#include <splice/execution/hydration/hydration_program.hpp>
#include <splice/execution/hydration/value_sampler.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <cstring>
#include <utility>
#include <variant>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

Result<uint256_t>
sample_word(ValueSampler &sampler, HydrationCommand const &command)
{
    auto const account = sampler.resolve_account(
        command.account.source, command.account.explicit_account);

    switch (command.kind) {
    case DataKind::NativeBalance:
    case DataKind::CallValue:
        return sampler.native_balance_of(account);
    case DataKind::AssetBalance:
        return sampler.asset_balance_of(command.asset, account);
    case DataKind::AssetAllowance: {
        auto const spender = sampler.resolve_account(
            command.spender.source, command.spender.explicit_account);
        return sampler.asset_allowance_of(command.asset, account, spender);
    }
    case DataKind::AccountId:
    case DataKind::CallTarget:
        break;
    }
    SPLICE_ABORT("data kind is not a word");
}

Result<void> write_input(
    CallDescriptor &call, size_t const call_index,
    HydrationCommand const &command, byte_string_view const value)
{
    size_t const width = write_width(command.kind);
    size_t const offset = command.offset;
    if (SPLICE_UNLIKELY(offset + width > call.input.size())) {
        LOG_WARNING(
            "call {} write of {} bytes at offset {} exceeds input of {} bytes",
            call_index,
            width,
            offset,
            call.input.size());
        return HydrationError::OffsetOutOfBounds;
    }
    std::memcpy(call.input.data() + offset, value.data(), width);
    return outcome::success();
}

Result<void> apply(
    ValueSampler &sampler, HydrationCommand const &command,
    CallDescriptor &call, size_t const call_index)
{
    switch (command.kind) {
    case DataKind::AccountId: {
        auto const account = sampler.resolve_account(
            command.account.source, command.account.explicit_account);
        return write_input(
            call,
            call_index,
            command,
            byte_string_view{account.bytes, sizeof(account.bytes)});
    }
    case DataKind::CallTarget:
        call.target = sampler.resolve_account(
            command.account.source, command.account.explicit_account);
        return outcome::success();
    case DataKind::CallValue: {
        BOOST_OUTCOME_TRY(auto const amount, sample_word(sampler, command));
        call.native_amount = amount;
        return outcome::success();
    }
    case DataKind::NativeBalance:
    case DataKind::AssetBalance:
    case DataKind::AssetAllowance: {
        BOOST_OUTCOME_TRY(auto const amount, sample_word(sampler, command));
        auto const word = intx::be::store<bytes32_t>(amount);
        return write_input(
            call,
            call_index,
            command,
            byte_string_view{word.bytes, sizeof(word.bytes)});
    }
    }
    SPLICE_ABORT("invalid data kind");
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

Result<void> hydrate(
    ValueSampler &sampler, HydrationProgram const &program, CallBatch &calls)
{
    CallBatch working = calls;
    size_t cursor = program.initial_call_index;

    for (auto const &entry : program.entries) {
        if (auto const *advance = std::get_if<CursorAdvance>(&entry)) {
            cursor = advance->call_index;
            continue;
        }

        auto const &command = std::get<HydrationCommand>(entry);
        if (SPLICE_UNLIKELY(cursor >= working.size())) {
            LOG_WARNING(
                "hydration targets call {} of a batch of {}",
                cursor,
                working.size());
            return HydrationError::CallIndexOutOfBounds;
        }
        BOOST_OUTCOME_TRY(apply(sampler, command, working[cursor], cursor));
    }

    calls = std::move(working);
    return outcome::success();
}

Result<void> hydrate(
    Host &host, ExecutionFrame &frame, byte_string_view const program,
    CallBatch &calls, ErrorOperand *const operand)
{
    BOOST_OUTCOME_TRY(
        auto const decoded, decode_hydration_program(program, operand));
    if (decoded.entries.empty()) {
        return outcome::success();
    }
    ValueSampler sampler{host, frame};
    return hydrate(sampler, decoded, calls);
}

SPLICE_NAMESPACE_END
