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
#include <splice/core/bytes.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/host/contract.hpp>
#include <splice/execution/state/account_state.hpp>
#include <splice/execution/state/ledger.hpp>
#include <splice/execution/state/state.hpp>

#include <limits>
#include <memory>
#include <utility>

SPLICE_NAMESPACE_BEGIN

AccountState Ledger::read_account(Address const &address) const
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return AccountState{};
    }
    return it->second;
}

std::shared_ptr<NativeContract> Ledger::read_code(Address const &address) const
{
    auto const it = code_.find(address);
    if (it == code_.end()) {
        return nullptr;
    }
    return it->second;
}

uint256_t Ledger::get_balance(Address const &address) const
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return 0;
    }
    return it->second.balance_;
}

bytes32_t
Ledger::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const it = accounts_.find(address);
    if (it == accounts_.end()) {
        return {};
    }
    return it->second.get_storage(key);
}

void Ledger::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &account = accounts_[address];
    SPLICE_ASSERT(
        std::numeric_limits<uint256_t>::max() - delta >= account.balance_,
        "balance overflow");
    account.balance_ += delta;
}

void Ledger::set_code(
    Address const &address, std::shared_ptr<NativeContract> contract)
{
    code_[address] = std::move(contract);
}

void Ledger::commit(State const &state)
{
    SPLICE_ASSERT(state.version() == 0);

    for (auto const &[address, stack] : state.current()) {
        AccountState account = stack.recent();
        account.transient_storage_.clear();
        accounts_[address] = std::move(account);
    }
}

SPLICE_NAMESPACE_END
