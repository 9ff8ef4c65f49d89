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

#include <evmc/evmc.hpp>

#include <cstdint>

SPLICE_NAMESPACE_BEGIN

class Host;

// Code deployed at an address. Runs with the message it was invoked with;
// the message recipient owns the storage the code operates on.
class NativeContract
{
public:
    virtual ~NativeContract() = default;

    virtual evmc::Result execute(Host &, evmc_message const &) = 0;
};

inline evmc::Result
make_success_result(byte_string_view const output, int64_t const gas_left)
{
    return evmc::Result(
        EVMC_SUCCESS, gas_left, 0, output.data(), output.size());
}

// A revert hands the unused gas back to the caller.
inline evmc::Result
make_revert_result(byte_string_view const output, int64_t const gas_left)
{
    return evmc::Result(
        EVMC_REVERT,
        gas_left,
        0 /* gas refund */,
        output.data(),
        output.size());
}

// Reverts with the status code message as output.
template <class StatusCode>
evmc::Result make_error_result(StatusCode const &error, int64_t const gas_left)
{
    auto const message = error.message();
    return evmc::Result(
        EVMC_REVERT,
        gas_left,
        0 /* gas refund */,
        reinterpret_cast<uint8_t const *>(message.data()),
        message.size());
}

SPLICE_NAMESPACE_END
