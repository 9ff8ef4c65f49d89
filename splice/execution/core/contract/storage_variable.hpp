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
#include <splice/core/unaligned.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <array>
#include <cstring>
#include <optional>
#include <type_traits>

SPLICE_NAMESPACE_BEGIN

// A value of type T laid out over consecutive storage slots of one account,
// starting at a key.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);
    using Slots = std::array<bytes32_t, N>;

    static Slots to_slots(T const &t)
    {
        Slots slots{};
        std::memcpy(&slots[0].bytes, &t, sizeof(T));
        return slots;
    }

    static T from_slots(Slots const &slots)
    {
        return unaligned_load<T>(&slots[0].bytes[0]);
    }

private:
    State &state_;
    Address const owner_;
    uint256_t const base_;

    bytes32_t slot_key(size_t const i) const
    {
        return intx::be::store<bytes32_t>(base_ + i);
    }

    void store_slots(Slots const &slots)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(owner_, slot_key(i), slots[i]);
        }
    }

public:
    StorageVariable(State &state, Address const &owner, bytes32_t const &key)
        : state_{state}
        , owner_{owner}
        , base_{intx::be::load<uint256_t>(key)}
    {
    }

    T load() const
    {
        Slots slots;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(owner_, slot_key(i));
        }
        return from_slots(slots);
    }

    std::optional<T> load_checked() const
    {
        Slots slots;
        bool has_data = false;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(owner_, slot_key(i));
            has_data |= (slots[i] != bytes32_t{});
        }
        return has_data ? from_slots(slots) : std::optional<T>{};
    }

    void store(T const &value)
    {
        store_slots(to_slots(value));
    }

    void clear()
    {
        store_slots(Slots{});
    }
};

SPLICE_NAMESPACE_END
