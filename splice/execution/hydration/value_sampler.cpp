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

#include <splice/core/assert.h>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/asset/asset_client.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/hydration/value_sampler.hpp>
#include <splice/execution/state/state.hpp>

#include <intx/intx.hpp>

SPLICE_NAMESPACE_BEGIN

ValueSampler::ValueSampler(Host &host, ExecutionFrame &frame)
    : host_{host}
    , frame_{frame}
    , self_{frame.storage_owner}
    , caller_{frame.caller}
    , origin_{frame.origin}
{
}

Address ValueSampler::resolve_account(
    ValueSource const source, Address const &explicit_account) const
{
    switch (source) {
    case ValueSource::Self:
        return self_;
    case ValueSource::Caller:
        return caller_;
    case ValueSource::Origin:
        return origin_;
    case ValueSource::Explicit:
        return explicit_account;
    }
    SPLICE_ABORT("invalid value source");
}

uint256_t ValueSampler::native_balance_of(Address const &account) const
{
    return intx::be::load<uint256_t>(host_.state().get_balance(account));
}

Result<uint256_t> ValueSampler::asset_balance_of(
    Address const &asset, Address const &account)
{
    return query_balance(host_, frame_, asset, account);
}

Result<uint256_t> ValueSampler::asset_allowance_of(
    Address const &asset, Address const &owner, Address const &spender)
{
    return query_allowance(host_, frame_, asset, owner, spender);
}

SPLICE_NAMESPACE_END
