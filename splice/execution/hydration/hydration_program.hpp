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
#include <splice/core/config.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/error_operand.hpp>
#include <splice/execution/hydration/value_sampler.hpp>

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

SPLICE_NAMESPACE_BEGIN

enum class DataKind : uint8_t
{
    AccountId = 1,
    NativeBalance = 2,
    AssetBalance = 3,
    AssetAllowance = 4,
    CallTarget = 5,
    CallValue = 6,
};

struct AccountOperand
{
    ValueSource source{ValueSource::Self};
    Address explicit_account{}; // only for ValueSource::Explicit

    friend bool
    operator==(AccountOperand const &, AccountOperand const &) = default;
};

struct HydrationCommand
{
    DataKind kind{DataKind::AccountId};
    AccountOperand account{};
    Address asset{}; // AssetBalance, AssetAllowance
    AccountOperand spender{}; // AssetAllowance
    uint16_t offset{0}; // all kinds but CallTarget and CallValue

    friend bool
    operator==(HydrationCommand const &, HydrationCommand const &) = default;
};

// Moves the cursor to another call of the batch.
struct CursorAdvance
{
    uint8_t call_index{0};

    friend bool
    operator==(CursorAdvance const &, CursorAdvance const &) = default;
};

using HydrationEntry = std::variant<CursorAdvance, HydrationCommand>;

struct HydrationProgram
{
    uint8_t initial_call_index{0};
    std::vector<HydrationEntry> entries{};

    friend bool
    operator==(HydrationProgram const &, HydrationProgram const &) = default;
};

// program := [initial_call_index:u8 entry*]
// entry   := 0x00 call_index:u8
//          | kind_and_source:u8 [account:address] [asset:address]
//            [spender_source:u8 [spender:address]] [offset:u16]
//
// The command byte carries the data kind in the top nibble and the value
// source in the bottom nibble. An empty program hydrates nothing.
inline constexpr uint8_t CURSOR_ADVANCE_MARKER = 0x00;

constexpr bool writes_input(DataKind const kind)
{
    return kind != DataKind::CallTarget && kind != DataKind::CallValue;
}

// bytes written into the input buffer
constexpr size_t write_width(DataKind const kind)
{
    return kind == DataKind::AccountId ? 20 : 32;
}

// The offending nibble of UnknownValueSource and UnknownDataKind goes to
// `operand`.
Result<HydrationProgram>
decode_hydration_program(byte_string_view, ErrorOperand *operand = nullptr);
byte_string encode_hydration_program(HydrationProgram const &);

SPLICE_NAMESPACE_END
