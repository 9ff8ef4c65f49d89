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
#include <splice/execution/core/address.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>

SPLICE_NAMESPACE_BEGIN

class State;

inline constexpr int32_t MAX_CALL_DEPTH = 1024;

// Routes messages between accounts of one transaction. Each call runs in its
// own state version which is accepted on success and rejected otherwise.
class Host
{
    State &state_;
    Address const origin_;
    byte_string return_data_{};

public:
    Host(State &, Address const &origin);
    Host(Host const &) = delete;
    Host &operator=(Host const &) = delete;

    evmc::Result call(evmc_message const &);

    State &state()
    {
        return state_;
    }

    Address const &origin() const
    {
        return origin_;
    }

    // output of the most recently completed call
    byte_string_view return_data() const
    {
        return return_data_;
    }
};

SPLICE_NAMESPACE_END
