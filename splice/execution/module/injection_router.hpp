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
#include <splice/core/int.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/host/contract.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <utility>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;

struct Injection
{
    Address asset;
    Address target;
    byte_string input;
    uint256_t offset;
    bytes32_t placeholder;
};

// Replaces a 32 byte placeholder in a call's input with the executing
// account's whole balance of an asset, then makes the call. A fungible
// asset is approved to the target for exactly that amount; the native asset
// is sent along as value.
Result<byte_string> inject_and_call(Host &, ExecutionFrame &, Injection);

// Deployed at INJECTION_ROUTER_CA. Payable.
class InjectionRouter : public NativeContract
{
public:
    using PrecompileFunc = Result<byte_string> (InjectionRouter::*)(
        Host &, ExecutionFrame &, byte_string_view);

    static std::pair<PrecompileFunc, uint64_t> dispatch(byte_string_view &);

    evmc::Result execute(Host &, evmc_message const &) override;

    Result<byte_string>
    inject_and_call(Host &, ExecutionFrame &, byte_string_view);
    // pulls the caller's whole balance of the asset first
    Result<byte_string>
    inject_sweep_and_call(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string> fallback(Host &, ExecutionFrame &, byte_string_view);
};

SPLICE_NAMESPACE_END
