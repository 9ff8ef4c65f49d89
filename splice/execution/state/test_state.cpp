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

#include <splice/core/bytes.hpp>
#include <splice/core/int.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/receipt.hpp>
#include <splice/execution/state/ledger.hpp>
#include <splice/execution/state/state.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace splice;

namespace
{
    constexpr auto a = 0x5353535353535353535353535353535353535353_address;
    constexpr auto b = 0xbebebebebebebebebebebebebebebebebebebebe_address;
    constexpr auto key1 =
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32;
    constexpr auto key2 =
        0x1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c1c_bytes32;
    constexpr auto value1 =
        0x0000000000000000000000000000000000000000000000000000000000000003_bytes32;
    constexpr auto value2 =
        0x0000000000000000000000000000000000000000000000000000000000000007_bytes32;

    uint256_t balance_of(State &s, Address const &address)
    {
        return intx::be::load<uint256_t>(s.get_balance(address));
    }
}

TEST(State, reads_through_to_ledger)
{
    Ledger ledger;
    ledger.add_to_balance(a, 10'000);

    State s{ledger};
    EXPECT_EQ(balance_of(s, a), 10'000);
    EXPECT_EQ(balance_of(s, b), 0);
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
}

TEST(State, pop_reject_restores_balances_and_storage)
{
    Ledger ledger;
    ledger.add_to_balance(a, 10'000);
    State s{ledger};

    s.push();
    s.subtract_from_balance(a, 4'000);
    s.add_to_balance(b, 4'000);
    s.set_storage(b, key1, value1);
    EXPECT_EQ(balance_of(s, b), 4'000);
    s.pop_reject();

    EXPECT_EQ(balance_of(s, a), 10'000);
    EXPECT_EQ(balance_of(s, b), 0);
    EXPECT_EQ(s.get_storage(b, key1), bytes32_t{});
}

TEST(State, nested_accept_inside_reject)
{
    Ledger ledger;
    State s{ledger};

    s.push();
    s.set_storage(a, key1, value1);
    {
        s.push();
        s.set_storage(a, key2, value2);
        s.pop_accept();
    }
    EXPECT_EQ(s.get_storage(a, key2), value2);
    s.pop_reject();

    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});
}

TEST(State, inner_reject_keeps_outer_changes)
{
    Ledger ledger;
    State s{ledger};

    s.push();
    s.set_storage(a, key1, value1);
    {
        s.push();
        s.set_storage(a, key1, value2);
        s.pop_reject();
    }
    EXPECT_EQ(s.get_storage(a, key1), value1);
    s.pop_accept();
    EXPECT_EQ(s.get_storage(a, key1), value1);
}

TEST(State, transient_storage_is_versioned)
{
    Ledger ledger;
    State s{ledger};

    s.push();
    s.set_transient_storage(a, key1, value1);
    {
        s.push();
        s.set_transient_storage(a, key1, value2);
        s.pop_reject();
    }
    EXPECT_EQ(s.get_transient_storage(a, key1), value1);
    s.pop_accept();
    EXPECT_EQ(s.get_transient_storage(a, key1), value1);
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
}

TEST(State, logs_follow_frames)
{
    Ledger ledger;
    State s{ledger};

    Receipt::Log const log1{.data = {0x01}, .topics = {key1}, .address = a};
    Receipt::Log const log2{.data = {0x02}, .topics = {key2}, .address = b};

    s.push();
    s.store_log(log1);
    {
        s.push();
        s.store_log(log2);
        s.pop_reject();
    }
    s.pop_accept();

    ASSERT_EQ(s.logs().size(), 1);
    EXPECT_EQ(s.logs()[0], log1);
}

TEST(State, commit_drops_transient_storage)
{
    Ledger ledger;
    {
        State s{ledger};
        s.push();
        s.add_to_balance(a, 5);
        s.set_storage(a, key1, value1);
        s.set_transient_storage(a, key2, value2);
        s.pop_accept();
        ledger.commit(s);
    }

    EXPECT_EQ(ledger.get_balance(a), 5);
    EXPECT_EQ(ledger.get_storage(a, key1), value1);

    State s{ledger};
    EXPECT_EQ(s.get_transient_storage(a, key2), bytes32_t{});
    EXPECT_EQ(s.get_storage(a, key1), value1);
}

TEST(State, zero_value_clears_slot)
{
    Ledger ledger;
    State s{ledger};

    s.push();
    s.set_storage(a, key1, value1);
    s.set_storage(a, key1, bytes32_t{});
    s.pop_accept();
    ledger.commit(s);

    EXPECT_EQ(ledger.read_account(a).storage_.size(), 0);
}
