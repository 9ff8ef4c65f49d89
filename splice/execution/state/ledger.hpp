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
#include <splice/execution/state/account_state.hpp>

#include <ankerl/unordered_dense.h>

#include <memory>

SPLICE_NAMESPACE_BEGIN

class NativeContract;
class State;

// Durable world state: balances, storage and deployed code. Transactions run
// against a State layered on top and are merged back on success.
class Ledger
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Map<Address, AccountState> accounts_{};
    Map<Address, std::shared_ptr<NativeContract>> code_{};

public:
    Ledger() = default;
    Ledger(Ledger &&) = delete;
    Ledger(Ledger const &) = delete;
    Ledger &operator=(Ledger &&) = delete;
    Ledger &operator=(Ledger const &) = delete;

    AccountState read_account(Address const &) const;
    std::shared_ptr<NativeContract> read_code(Address const &) const;

    uint256_t get_balance(Address const &) const;
    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void add_to_balance(Address const &, uint256_t const &delta);
    void set_code(Address const &, std::shared_ptr<NativeContract>);

    // Applies the outermost frame of a finished transaction. Transient
    // storage is discarded.
    void commit(State const &);
};

SPLICE_NAMESPACE_END
