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
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/core/unaligned.hpp>

#include <cstddef>
#include <type_traits>

SPLICE_NAMESPACE_BEGIN

// Readers for tightly packed encodings (no padding, big endian integers).
// Each consumes from the front of `enc` and fails with the caller's
// truncation error, leaving `enc` untouched, if too few bytes remain.

template <typename T, typename Error>
    requires std::is_trivially_copyable_v<T>
Result<T> decode_packed(byte_string_view &enc, Error const truncated)
{
    if (SPLICE_UNLIKELY(enc.size() < sizeof(T))) {
        return truncated;
    }
    T const output = unaligned_load<T>(enc.data());
    enc.remove_prefix(sizeof(T));
    return output;
}

template <typename Error>
Result<byte_string_view> decode_packed_bytes(
    byte_string_view &enc, size_t const length, Error const truncated)
{
    if (SPLICE_UNLIKELY(enc.size() < length)) {
        return truncated;
    }
    auto const output = enc.substr(0, length);
    enc.remove_prefix(length);
    return output;
}

SPLICE_NAMESPACE_END
