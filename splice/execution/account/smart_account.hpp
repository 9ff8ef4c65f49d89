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
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/host/contract.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <utility>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;

// Owner-gated wallet. `execute` calls out with the wallet as sender;
// `executeDelegate` lends the wallet's storage and balance to a module. The
// output of the inner call is returned as is, and its failure output is
// bubbled unchanged. Calls without input accept native value.
class SmartAccount : public NativeContract
{
    Address const owner_;

    Result<void> only_owner(ExecutionFrame const &) const;

public:
    explicit SmartAccount(Address const &owner);

    using PrecompileFunc = Result<byte_string> (SmartAccount::*)(
        Host &, ExecutionFrame &, byte_string_view);

    static std::pair<PrecompileFunc, uint64_t> dispatch(byte_string_view &);

    evmc::Result execute(Host &, evmc_message const &) override;

    Result<byte_string> execute_call(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string>
    execute_delegate(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string> owner(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string> receive(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string> fallback(Host &, ExecutionFrame &, byte_string_view);
};

SPLICE_NAMESPACE_END
