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
#include <splice/core/likely.h>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/receipt.hpp>
#include <splice/execution/state/account_state.hpp>
#include <splice/execution/state/ledger.hpp>
#include <splice/execution/state/state.hpp>
#include <splice/execution/state/version_stack.hpp>

#include <intx/intx.hpp>

#include <limits>
#include <memory>
#include <vector>

SPLICE_NAMESPACE_BEGIN

AccountState const &State::original_account_state(Address const &address)
{
    auto it = original_.find(address);
    if (it == original_.end()) {
        it = original_.try_emplace(address, ledger_.read_account(address))
                 .first;
    }
    return it->second;
}

AccountState const &State::recent_account_state(Address const &address)
{
    auto const it = current_.find(address);
    if (it != current_.end()) {
        return it->second.recent();
    }
    return original_account_state(address);
}

AccountState &State::current_account_state(Address const &address)
{
    auto it = current_.find(address);
    if (SPLICE_UNLIKELY(it == current_.end())) {
        auto const &account_state = original_account_state(address);
        it = current_.try_emplace(address, account_state, version_).first;
    }
    return it->second.current(version_);
}

State::State(Ledger &ledger)
    : ledger_{ledger}
{
}

State::Map<Address, VersionStack<AccountState>> const &State::current() const
{
    return current_;
}

unsigned State::version() const
{
    return version_;
}

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    SPLICE_ASSERT(version_);

    for (auto &it : current_) {
        it.second.pop_accept(version_);
    }

    logs_.pop_accept(version_);

    --version_;
}

void State::pop_reject()
{
    SPLICE_ASSERT(version_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.pop_reject(version_)) {
            removals.push_back(it.first);
        }
    }

    logs_.pop_reject(version_);

    while (removals.size()) {
        current_.erase(removals.back());
        removals.pop_back();
    }

    --version_;
}

bytes32_t State::get_balance(Address const &address)
{
    return intx::be::store<bytes32_t>(recent_account_state(address).balance_);
}

bytes32_t State::get_storage(Address const &address, bytes32_t const &key)
{
    return recent_account_state(address).get_storage(key);
}

bytes32_t
State::get_transient_storage(Address const &address, bytes32_t const &key)
{
    return recent_account_state(address).get_transient_storage(key);
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &account_state = current_account_state(address);

    SPLICE_ASSERT(
        std::numeric_limits<uint256_t>::max() - delta >=
            account_state.balance_,
        "balance overflow");

    account_state.balance_ += delta;
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account_state = current_account_state(address);

    SPLICE_ASSERT(delta <= account_state.balance_);

    account_state.balance_ -= delta;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    current_account_state(address).set_storage(key, value);
}

void State::set_transient_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    current_account_state(address).set_transient_storage(key, value);
}

std::shared_ptr<NativeContract> State::get_code(Address const &address)
{
    return ledger_.read_code(address);
}

std::vector<Receipt::Log> const &State::logs()
{
    return logs_.recent();
}

void State::store_log(Receipt::Log const &log)
{
    auto &logs = logs_.current(version_);
    logs.push_back(log);
}

SPLICE_NAMESPACE_END
