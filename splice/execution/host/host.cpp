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
#include <splice/core/int.hpp>
#include <splice/core/likely.h>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/host/contract.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/state/state.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <optional>
#include <utility>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

bool sender_has_balance(State &state, evmc_message const &msg)
{
    auto const value = intx::be::load<uint256_t>(msg.value);
    auto const balance =
        intx::be::load<uint256_t>(state.get_balance(msg.sender));
    return value <= balance;
}

void transfer_balances(State &state, evmc_message const &msg)
{
    auto const value = intx::be::load<uint256_t>(msg.value);
    state.subtract_from_balance(msg.sender, value);
    state.add_to_balance(msg.recipient, value);
}

std::optional<evmc::Result> pre_call(evmc_message const &msg, State &state)
{
    state.push();

    if (msg.kind == EVMC_DELEGATECALL) {
        return std::nullopt;
    }

    if (intx::be::load<uint256_t>(msg.value) == 0) {
        return std::nullopt;
    }

    if (SPLICE_UNLIKELY(msg.flags & EVMC_STATIC)) {
        state.pop_reject();
        return evmc::Result{EVMC_STATIC_MODE_VIOLATION};
    }

    if (SPLICE_UNLIKELY(!sender_has_balance(state, msg))) {
        state.pop_reject();
        return evmc::Result{EVMC_INSUFFICIENT_BALANCE, msg.gas};
    }

    transfer_balances(state, msg);
    return std::nullopt;
}

void post_call(State &state, evmc::Result const &result)
{
    if (result.status_code == EVMC_SUCCESS) {
        state.pop_accept();
    }
    else {
        state.pop_reject();
    }
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

Host::Host(State &state, Address const &origin)
    : state_{state}
    , origin_{origin}
{
}

evmc::Result Host::call(evmc_message const &msg)
{
    evmc::Result result;

    if (SPLICE_UNLIKELY(msg.depth > MAX_CALL_DEPTH)) {
        result = evmc::Result{EVMC_CALL_DEPTH_EXCEEDED, msg.gas};
    }
    else if (auto pre = pre_call(msg, state_); pre.has_value()) {
        result = std::move(pre.value());
    }
    else {
        auto const code = state_.get_code(msg.code_address);
        if (code) {
            result = code->execute(*this, msg);
        }
        else {
            result = evmc::Result{EVMC_SUCCESS, msg.gas};
        }
        post_call(state_, result);
    }

    if (result.status_code != EVMC_SUCCESS) {
        LOG_DEBUG(
            "call {} -> {} (code {}) failed with status {}",
            Address{msg.sender},
            Address{msg.recipient},
            Address{msg.code_address},
            static_cast<int>(result.status_code));
    }

    return_data_.assign(result.output_data, result.output_size);
    return result;
}

SPLICE_NAMESPACE_END
