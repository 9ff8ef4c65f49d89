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

#include <splice/core/byte_string.hpp>
#include <splice/core/config.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/core/receipt.hpp>
#include <splice/execution/host/execute_transaction.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/state/ledger.hpp>
#include <splice/execution/state/state.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

SPLICE_NAMESPACE_BEGIN

ExecutionResult execute_transaction(Ledger &ledger, Transaction const &tx)
{
    State state{ledger};
    Host host{state, tx.sender};

    evmc_message const msg{
        .kind = EVMC_CALL,
        .flags = 0,
        .depth = 0,
        .gas = tx.gas_limit,
        .recipient = tx.to,
        .sender = tx.sender,
        .input_data = tx.data.data(),
        .input_size = tx.data.size(),
        .value = intx::be::store<evmc::uint256be>(tx.value),
        .create2_salt = {},
        .code_address = tx.to,
        .code = nullptr,
        .code_size = 0,
    };

    auto const result = host.call(msg);
    bool const success = result.status_code == EVMC_SUCCESS;

    ExecutionResult output{
        .receipt =
            Receipt{
                .status = success ? 1u : 0u,
                .gas_used = static_cast<uint64_t>(tx.gas_limit - result.gas_left),
                .logs = state.logs(),
            },
        .output = byte_string{result.output_data, result.output_size},
    };

    if (success) {
        ledger.commit(state);
    }
    else {
        LOG_INFO(
            "transaction from {} to {} reverted with status {}",
            tx.sender,
            tx.to,
            static_cast<int>(result.status_code));
    }

    return output;
}

SPLICE_NAMESPACE_END
