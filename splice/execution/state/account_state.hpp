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
#include <splice/core/likely.h>

#include <ankerl/unordered_dense.h>

SPLICE_NAMESPACE_BEGIN

class AccountState
{
public:
    template <class Key, class T>
    using Map = ankerl::unordered_dense::segmented_map<Key, T>;

    uint256_t balance_{0};
    Map<bytes32_t, bytes32_t> storage_{};
    Map<bytes32_t, bytes32_t> transient_storage_{};

    AccountState() = default;
    AccountState(AccountState &&) = default;
    AccountState(AccountState const &) = default;
    AccountState &operator=(AccountState &&) = default;
    AccountState &operator=(AccountState const &) = default;

    bytes32_t get_storage(bytes32_t const &key) const
    {
        auto const it = storage_.find(key);
        if (SPLICE_LIKELY(it != storage_.end())) {
            return it->second;
        }
        return {};
    }

    bytes32_t get_transient_storage(bytes32_t const &key) const
    {
        auto const it = transient_storage_.find(key);
        if (SPLICE_LIKELY(it != transient_storage_.end())) {
            return it->second;
        }
        return {};
    }

    // zero values are not kept, an unset slot reads as zero
    void set_storage(bytes32_t const &key, bytes32_t const &value)
    {
        if (value == bytes32_t{}) {
            storage_.erase(key);
        }
        else {
            storage_[key] = value;
        }
    }

    void set_transient_storage(bytes32_t const &key, bytes32_t const &value)
    {
        if (value == bytes32_t{}) {
            transient_storage_.erase(key);
        }
        else {
            transient_storage_[key] = value;
        }
    }
};

SPLICE_NAMESPACE_END
