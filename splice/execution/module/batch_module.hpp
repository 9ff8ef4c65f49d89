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
#include <splice/execution/batch/invocation_guard.hpp>
#include <splice/execution/host/contract.hpp>
#include <splice/execution/module/constants.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <utility>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;

// Hydrates and dispatches call batches on behalf of the account that borrows
// it, and settles the assets left behind. Deployed at BATCH_MODULE_CA.
class BatchModule : public NativeContract
{
    InvocationGuard const guard_{BATCH_MODULE_CA};

public:
    using PrecompileFunc = Result<byte_string> (BatchModule::*)(
        Host &, ExecutionFrame &, byte_string_view);

    static std::pair<PrecompileFunc, uint64_t> dispatch(byte_string_view &);

    evmc::Result execute(Host &, evmc_message const &) override;

    Result<byte_string>
    hydrate_and_execute(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string>
    hydrate_execute_and_sweep(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string> sweep(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string>
    sweep_capped(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string>
    refund_and_sweep(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string>
    validate_op_hash_and_sweep(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string>
    record_op_success(Host &, ExecutionFrame &, byte_string_view);
    Result<byte_string> fallback(Host &, ExecutionFrame &, byte_string_view);
};

SPLICE_NAMESPACE_END
