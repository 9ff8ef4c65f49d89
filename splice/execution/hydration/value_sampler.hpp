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
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>

#include <cstdint>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;

enum class ValueSource : uint8_t
{
    Self = 0,
    Caller = 1,
    Origin = 2,
    Explicit = 3,
};

// Read side of hydration. The invocation context is fixed when the sampler
// is created; balances and allowances are read when asked for.
class ValueSampler
{
    Host &host_;
    ExecutionFrame &frame_;
    Address const self_;
    Address const caller_;
    Address const origin_;

public:
    ValueSampler(Host &, ExecutionFrame &);

    Address
    resolve_account(ValueSource, Address const &explicit_account = {}) const;

    uint256_t native_balance_of(Address const &) const;

    // AssetQueryFailed if the asset does not answer
    Result<uint256_t>
    asset_balance_of(Address const &asset, Address const &account);
    Result<uint256_t> asset_allowance_of(
        Address const &asset, Address const &owner, Address const &spender);
};

SPLICE_NAMESPACE_END
