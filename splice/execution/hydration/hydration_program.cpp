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
#include <splice/core/config.hpp>
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/error_operand.hpp>
#include <splice/execution/core/packed_decode.hpp>
#include <splice/execution/hydration/hydration_error.hpp>
#include <splice/execution/hydration/hydration_program.hpp>
#include <splice/execution/hydration/value_sampler.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <utility>
#include <variant>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint8_t MAX_VALUE_SOURCE = static_cast<uint8_t>(ValueSource::Explicit);
constexpr uint8_t MAX_DATA_KIND = static_cast<uint8_t>(DataKind::CallValue);

template <typename T>
Result<T> read(byte_string_view &enc)
{
    return decode_packed<T>(enc, HydrationError::TruncatedProgram);
}

Result<ValueSource>
decode_value_source(uint8_t const nibble, ErrorOperand *const operand)
{
    if (SPLICE_UNLIKELY(nibble > MAX_VALUE_SOURCE)) {
        LOG_WARNING("unknown value source 0x{:x}", nibble);
        record_operand(operand, nibble);
        return HydrationError::UnknownValueSource;
    }
    return static_cast<ValueSource>(nibble);
}

Result<AccountOperand>
decode_account(byte_string_view &enc, ValueSource const source)
{
    AccountOperand account{.source = source};
    if (source == ValueSource::Explicit) {
        BOOST_OUTCOME_TRY(account.explicit_account, read<Address>(enc));
    }
    return account;
}

Result<HydrationCommand> decode_command(
    byte_string_view &enc, uint8_t const op, ErrorOperand *const operand)
{
    // source is validated first, a bad source nibble wins over a bad kind
    BOOST_OUTCOME_TRY(
        auto const source, decode_value_source(op & 0x0f, operand));
    uint8_t const kind_nibble = op >> 4;
    if (SPLICE_UNLIKELY(kind_nibble == 0 || kind_nibble > MAX_DATA_KIND)) {
        LOG_WARNING("unknown data kind 0x{:x}", kind_nibble);
        record_operand(operand, kind_nibble);
        return HydrationError::UnknownDataKind;
    }

    HydrationCommand command{.kind = static_cast<DataKind>(kind_nibble)};
    BOOST_OUTCOME_TRY(command.account, decode_account(enc, source));

    if (command.kind == DataKind::AssetBalance ||
        command.kind == DataKind::AssetAllowance) {
        BOOST_OUTCOME_TRY(command.asset, read<Address>(enc));
    }
    if (command.kind == DataKind::AssetAllowance) {
        BOOST_OUTCOME_TRY(auto const spender_byte, read<uint8_t>(enc));
        BOOST_OUTCOME_TRY(
            auto const spender_source,
            decode_value_source(spender_byte, operand));
        BOOST_OUTCOME_TRY(command.spender, decode_account(enc, spender_source));
    }
    if (writes_input(command.kind)) {
        BOOST_OUTCOME_TRY(auto const offset, read<u16_be>(enc));
        command.offset = offset.native();
    }
    return command;
}

void append_account(byte_string &out, AccountOperand const &account)
{
    if (account.source == ValueSource::Explicit) {
        out.append(
            account.explicit_account.bytes,
            sizeof(account.explicit_account.bytes));
    }
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

Result<HydrationProgram>
decode_hydration_program(byte_string_view enc, ErrorOperand *const operand)
{
    HydrationProgram program;
    if (enc.empty()) {
        return program;
    }

    BOOST_OUTCOME_TRY(program.initial_call_index, read<uint8_t>(enc));
    while (!enc.empty()) {
        BOOST_OUTCOME_TRY(auto const op, read<uint8_t>(enc));
        if (op == CURSOR_ADVANCE_MARKER) {
            BOOST_OUTCOME_TRY(auto const index, read<uint8_t>(enc));
            program.entries.emplace_back(CursorAdvance{.call_index = index});
            continue;
        }
        BOOST_OUTCOME_TRY(auto command, decode_command(enc, op, operand));
        program.entries.emplace_back(std::move(command));
    }
    return program;
}

byte_string encode_hydration_program(HydrationProgram const &program)
{
    byte_string out;
    if (program.entries.empty()) {
        return out;
    }

    out.push_back(program.initial_call_index);
    for (auto const &entry : program.entries) {
        if (auto const *advance = std::get_if<CursorAdvance>(&entry)) {
            out.push_back(CURSOR_ADVANCE_MARKER);
            out.push_back(advance->call_index);
            continue;
        }

        auto const &command = std::get<HydrationCommand>(entry);
        out.push_back(static_cast<uint8_t>(
            (static_cast<uint8_t>(command.kind) << 4) |
            static_cast<uint8_t>(command.account.source)));
        append_account(out, command.account);
        if (command.kind == DataKind::AssetBalance ||
            command.kind == DataKind::AssetAllowance) {
            out.append(command.asset.bytes, sizeof(command.asset.bytes));
        }
        if (command.kind == DataKind::AssetAllowance) {
            out.push_back(static_cast<uint8_t>(command.spender.source));
            append_account(out, command.spender);
        }
        if (writes_input(command.kind)) {
            u16_be const offset{command.offset};
            out.append(offset.bytes, sizeof(offset.bytes));
        }
    }
    return out;
}

SPLICE_NAMESPACE_END
