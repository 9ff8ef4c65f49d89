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
#include <splice/execution/core/contract/abi_decode.hpp>
#include <splice/execution/core/contract/abi_decode_error.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <vector>

using namespace splice;

namespace
{
    constexpr auto asset = 0x00000000000000000000000000000000000a55e7_address;
    constexpr auto payee = 0xb0b0000000000000000000000000000000000002_address;
}

template <typename T>
class UintDecodeTest : public ::testing::Test
{
};

typedef ::testing::Types<u8_be, u16_be, u32_be, u64_be, u256_be> UintTypes;
TYPED_TEST_SUITE(UintDecodeTest, UintTypes);

TYPED_TEST(UintDecodeTest, uint)
{
    TypeParam expected{200};
    bytes32_t const encoded = abi_encode_uint<TypeParam>(expected);
    byte_string_view input{encoded};
    auto const decoded = abi_decode_fixed<TypeParam>(input);
    EXPECT_TRUE(input.empty());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().native(), expected.native());
}

TYPED_TEST(UintDecodeTest, input_too_short)
{
    bytes32_t const encoded = abi_encode_uint<TypeParam>(TypeParam{1});
    byte_string_view input = byte_string_view{encoded}.substr(1);
    auto const decoded = abi_decode_fixed<TypeParam>(input);
    EXPECT_EQ(input.size(), 31u);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), AbiDecodeError::InputTooShort);
}

TEST(AbiDecode, address_ignores_padding)
{
    bytes32_t encoded = abi_encode_address(payee);
    encoded.bytes[0] = 0xcc;
    byte_string_view input{encoded};
    auto const decoded = abi_decode_fixed<Address>(input);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), payee);
}

TEST(AbiDecode, bool)
{
    byte_string_view input;
    bytes32_t const t = abi_encode_bool(true);
    input = byte_string_view{t};
    auto decoded = abi_decode_bool(input);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded.value());

    bytes32_t const two = abi_encode_uint(u8_be{2});
    input = byte_string_view{two};
    decoded = abi_decode_bool(input);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), AbiDecodeError::InvalidBool);
}

TEST(AbiDecode, head_and_tail)
{
    byte_string const batch{0x01, 0x02, 0x03};
    AbiEncoder encoder;
    encoder.add_bytes(batch);
    encoder.add_bytes(byte_string_view{});
    encoder.add_address(payee);
    encoder.add_address_array({asset, payee});
    encoder.add_bool(true);
    auto const encoded = encoder.encode_final();

    byte_string_view head{encoded};
    auto const first = abi_decode_bytes(encoded, head);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), batch);

    auto const second = abi_decode_bytes(encoded, head);
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second.value().empty());

    auto const recipient = abi_decode_fixed<Address>(head);
    ASSERT_TRUE(recipient.has_value());
    EXPECT_EQ(recipient.value(), payee);

    auto const assets = abi_decode_address_array(encoded, head);
    ASSERT_TRUE(assets.has_value());
    EXPECT_EQ(assets.value(), (std::vector<Address>{asset, payee}));

    auto const flag = abi_decode_bool(head);
    ASSERT_TRUE(flag.has_value());
    EXPECT_TRUE(flag.value());

    // what remains of the head is the tail
    EXPECT_EQ(head.size(), encoded.size() - 5 * 32);
}

TEST(AbiDecode, invalid_offset)
{
    AbiEncoder encoder;
    encoder.add_uint(u256_be{1'000});
    auto const encoded = encoder.encode_final();

    byte_string_view head{encoded};
    auto const decoded = abi_decode_bytes(encoded, head);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.assume_error(), AbiDecodeError::InvalidOffset);
}

TEST(AbiDecode, length_mismatch)
{
    AbiEncoder encoder;
    encoder.add_bytes(byte_string(40, 0xab));
    auto encoded = encoder.encode_final();
    // drop the last word of the payload
    encoded.resize(encoded.size() - 32);

    byte_string_view head{encoded};
    auto const bytes = abi_decode_bytes(encoded, head);
    ASSERT_TRUE(bytes.has_error());
    EXPECT_EQ(bytes.assume_error(), AbiDecodeError::LengthMismatch);

    AbiEncoder arrays;
    arrays.add_address_array({asset, payee});
    auto truncated = arrays.encode_final();
    truncated.resize(truncated.size() - 32);

    head = byte_string_view{truncated};
    auto const addresses = abi_decode_address_array(truncated, head);
    ASSERT_TRUE(addresses.has_error());
    EXPECT_EQ(addresses.assume_error(), AbiDecodeError::LengthMismatch);
}
