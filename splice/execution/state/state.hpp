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

#include <splice/core/bytes.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/receipt.hpp>
#include <splice/execution/state/account_state.hpp>
#include <splice/execution/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <vector>

SPLICE_NAMESPACE_BEGIN

class Ledger;
class NativeContract;

// Per-transaction view of the ledger. Every call frame pushes a version;
// rejecting the frame restores balances, storage, transient storage and logs
// as they were when it was pushed.
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Ledger &ledger_;
    Map<Address, AccountState> original_{};
    Map<Address, VersionStack<AccountState>> current_{};
    VersionStack<std::vector<Receipt::Log>> logs_{{}};
    unsigned version_{0};

    AccountState const &original_account_state(Address const &);
    AccountState const &recent_account_state(Address const &);
    AccountState &current_account_state(Address const &);

public:
    explicit State(Ledger &);
    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    Map<Address, VersionStack<AccountState>> const &current() const;
    unsigned version() const;

    void push();
    void pop_accept();
    void pop_reject();

    ////////////////////////////////////////

    bytes32_t get_balance(Address const &);
    bytes32_t get_storage(Address const &, bytes32_t const &key);
    bytes32_t get_transient_storage(Address const &, bytes32_t const &key);

    ////////////////////////////////////////

    void add_to_balance(Address const &, uint256_t const &delta);
    void subtract_from_balance(Address const &, uint256_t const &delta);
    void
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);
    void set_transient_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////

    std::shared_ptr<NativeContract> get_code(Address const &);

    ////////////////////////////////////////

    std::vector<Receipt::Log> const &logs();
    void store_log(Receipt::Log const &);
};

SPLICE_NAMESPACE_END
