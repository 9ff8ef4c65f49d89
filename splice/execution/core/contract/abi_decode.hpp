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
#include <splice/core/bytes.hpp>
#include <splice/core/config.hpp>
#include <splice/core/likely.h>
#include <splice/core/math.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_decode_error.hpp>
#include <splice/execution/core/contract/big_endian.hpp>

#include <boost/outcome/try.hpp>

#include <concepts>
#include <cstring>
#include <type_traits>
#include <vector>

SPLICE_NAMESPACE_BEGIN

template <typename T>
    requires(
        BigEndianType<T> || std::same_as<T, Address> ||
        std::same_as<T, bytes32_t>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    static_assert(sizeof(T) <= 32);
    if (SPLICE_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = 32 - sizeof(T);
    T output{};
    std::memcpy(&output, enc.data() + offset, sizeof(T));
    enc.remove_prefix(32);
    return output;
}

inline Result<bool> abi_decode_bool(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const word, abi_decode_fixed<u256_be>(enc));
    auto const value = word.native();
    if (SPLICE_UNLIKELY(value > 1)) {
        return AbiDecodeError::InvalidBool;
    }
    return value == 1;
}

// Resolves the tail offset stored in the next head word. `args` is the whole
// argument block the offset is relative to.
inline Result<byte_string_view>
abi_decode_tail(byte_string_view const args, byte_string_view &head)
{
    BOOST_OUTCOME_TRY(auto const offset_be, abi_decode_fixed<u256_be>(head));
    auto const offset = offset_be.native();
    if (SPLICE_UNLIKELY(offset > args.size())) {
        return AbiDecodeError::InvalidOffset;
    }
    return args.substr(static_cast<size_t>(offset));
}

inline Result<byte_string_view>
abi_decode_bytes(byte_string_view const args, byte_string_view &head)
{
    BOOST_OUTCOME_TRY(auto tail, abi_decode_tail(args, head));
    BOOST_OUTCOME_TRY(auto const length_be, abi_decode_fixed<u256_be>(tail));
    auto const length = length_be.native();
    if (SPLICE_UNLIKELY(length > tail.size())) {
        return AbiDecodeError::LengthMismatch;
    }
    return tail.substr(0, static_cast<size_t>(length));
}

inline Result<std::vector<Address>>
abi_decode_address_array(byte_string_view const args, byte_string_view &head)
{
    BOOST_OUTCOME_TRY(auto tail, abi_decode_tail(args, head));
    BOOST_OUTCOME_TRY(auto const length_be, abi_decode_fixed<u256_be>(tail));
    auto const length = length_be.native();
    if (SPLICE_UNLIKELY(length > tail.size() / 32)) {
        return AbiDecodeError::LengthMismatch;
    }
    std::vector<Address> output;
    output.reserve(static_cast<size_t>(length));
    for (uint64_t i = 0; i < length; ++i) {
        BOOST_OUTCOME_TRY(auto const address, abi_decode_fixed<Address>(tail));
        output.push_back(address);
    }
    return output;
}

SPLICE_NAMESPACE_END
