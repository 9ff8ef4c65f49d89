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

#include <splice/core/config.hpp>
#include <splice/core/int.hpp>

SPLICE_NAMESPACE_BEGIN

// Operand of a parameterised error (a call index, a nibble). The site that
// raises the error records it, the contract boundary encodes it with the
// error's selector.
struct ErrorOperand
{
    uint256_t value{0};
    bool recorded{false};

    void record(uint256_t const &operand)
    {
        value = operand;
        recorded = true;
    }
};

// Records into `sink` when the caller asked for the operand.
inline void record_operand(ErrorOperand *const sink, uint256_t const &operand)
{
    if (sink != nullptr) {
        sink->record(operand);
    }
}

SPLICE_NAMESPACE_END
