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
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/error_operand.hpp>
#include <splice/execution/hydration/hydration_error.hpp>
#include <splice/execution/hydration/hydration_program.hpp>
#include <splice/execution/hydration/value_sampler.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <variant>

using namespace splice;

namespace
{
    constexpr auto asset = 0x00000000000000000000000000000000000a55e7_address;
    constexpr auto spender = 0x5be4de4000000000000000000000000000000004_address;

    byte_string with_address(byte_string prefix, Address const &a)
    {
        prefix.append(a.bytes, sizeof(a.bytes));
        return prefix;
    }
}

TEST(HydrationProgram, empty_program_hydrates_nothing)
{
    auto const decoded = decode_hydration_program(byte_string_view{});
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded.value().entries.empty());
    EXPECT_TRUE(encode_hydration_program(decoded.value()).empty());
}

TEST(HydrationProgram, decodes_commands_and_cursor_moves)
{
    // start at call 0; account id of self at 0, native balance of caller at
    // 32; move to call 1; call target from origin
    byte_string const enc{
        0x00, 0x10, 0x00, 0x00, 0x21, 0x00, 0x20, 0x00, 0x01, 0x52};

    auto const decoded = decode_hydration_program(enc);
    ASSERT_TRUE(decoded.has_value());
    auto const &program = decoded.value();
    EXPECT_EQ(program.initial_call_index, 0);
    ASSERT_EQ(program.entries.size(), 4);

    auto const &first = std::get<HydrationCommand>(program.entries[0]);
    EXPECT_EQ(first.kind, DataKind::AccountId);
    EXPECT_EQ(first.account.source, ValueSource::Self);
    EXPECT_EQ(first.offset, 0);

    auto const &second = std::get<HydrationCommand>(program.entries[1]);
    EXPECT_EQ(second.kind, DataKind::NativeBalance);
    EXPECT_EQ(second.account.source, ValueSource::Caller);
    EXPECT_EQ(second.offset, 32);

    EXPECT_EQ(
        std::get<CursorAdvance>(program.entries[2]), CursorAdvance{.call_index = 1});

    auto const &third = std::get<HydrationCommand>(program.entries[3]);
    EXPECT_EQ(third.kind, DataKind::CallTarget);
    EXPECT_EQ(third.account.source, ValueSource::Origin);

    EXPECT_EQ(encode_hydration_program(program), enc);
}

TEST(HydrationProgram, allowance_operands)
{
    HydrationProgram const program{
        .initial_call_index = 2,
        .entries = {HydrationCommand{
            .kind = DataKind::AssetAllowance,
            .account = {.source = ValueSource::Caller},
            .asset = asset,
            .spender =
                {.source = ValueSource::Explicit, .explicit_account = spender},
            .offset = 0x0104,
        }},
    };

    byte_string expected{0x02, 0x41};
    expected = with_address(expected, asset);
    expected.push_back(0x03);
    expected = with_address(expected, spender);
    expected += byte_string{0x01, 0x04};

    auto const enc = encode_hydration_program(program);
    EXPECT_EQ(enc, expected);

    auto const decoded = decode_hydration_program(enc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), program);
}

TEST(HydrationProgram, unknown_value_source)
{
    byte_string const enc{0x00, 0x14, 0x00, 0x00};
    ErrorOperand operand;
    auto const decoded = decode_hydration_program(enc, &operand);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), HydrationError::UnknownValueSource);
    ASSERT_TRUE(operand.recorded);
    EXPECT_EQ(operand.value, 0x04);

    // the source is checked before the kind
    byte_string const both_bad{0x00, 0x7f};
    ErrorOperand both_operand;
    auto const res = decode_hydration_program(both_bad, &both_operand);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), HydrationError::UnknownValueSource);
    EXPECT_EQ(both_operand.value, 0x0f);
}

TEST(HydrationProgram, unknown_data_kind)
{
    for (uint8_t const op : {uint8_t{0x70}, uint8_t{0xf3}, uint8_t{0x01}}) {
        byte_string const enc{0x00, op, 0x00, 0x00};
        ErrorOperand operand;
        auto const decoded = decode_hydration_program(enc, &operand);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), HydrationError::UnknownDataKind);
        ASSERT_TRUE(operand.recorded);
        EXPECT_EQ(operand.value, op >> 4);
    }
}

TEST(HydrationProgram, bad_spender_source)
{
    byte_string enc{0x00, 0x40};
    enc = with_address(enc, asset);
    enc += byte_string{0x09, 0x00, 0x00};
    ErrorOperand operand;
    auto const decoded = decode_hydration_program(enc, &operand);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), HydrationError::UnknownValueSource);
    EXPECT_EQ(operand.value, 0x09);
}

TEST(HydrationProgram, truncated)
{
    byte_string const cases[] = {
        {0x00, 0x20, 0x00}, // half an offset
        {0x00, 0x13, 0xaa}, // short explicit account
        {0x00, 0x30}, // missing asset
        {0x00, 0x00}, // cursor move without index
    };
    for (auto const &enc : cases) {
        auto const decoded = decode_hydration_program(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), HydrationError::TruncatedProgram);
    }
}
