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
#include <splice/core/int.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/receipt.hpp>

#include <cstdint>

SPLICE_NAMESPACE_BEGIN

class Ledger;

struct Transaction
{
    Address sender{};
    Address to{};
    uint256_t value{0};
    byte_string data{};
    int64_t gas_limit{30'000'000};
};

struct ExecutionResult
{
    Receipt receipt{};
    byte_string output{};
};

// Runs a transaction on a fresh state. Changes are merged into the ledger only
// if the outermost call succeeds.
ExecutionResult execute_transaction(Ledger &, Transaction const &);

SPLICE_NAMESPACE_END
