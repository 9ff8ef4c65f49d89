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
#include <splice/core/bytes.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/keccak.hpp>
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/asset/asset_error.hpp>
#include <splice/execution/asset/fungible_asset.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_decode.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/contract/events.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <splice/execution/host/contract.hpp>
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <limits>
#include <utility>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

struct Selector
{
    static constexpr uint32_t BALANCE_OF =
        abi_encode_selector("balanceOf(address)");
    static constexpr uint32_t ALLOWANCE =
        abi_encode_selector("allowance(address,address)");
    static constexpr uint32_t TOTAL_SUPPLY =
        abi_encode_selector("totalSupply()");
    static constexpr uint32_t TRANSFER =
        abi_encode_selector("transfer(address,uint256)");
    static constexpr uint32_t APPROVE =
        abi_encode_selector("approve(address,uint256)");
    static constexpr uint32_t TRANSFER_FROM =
        abi_encode_selector("transferFrom(address,address,uint256)");
    static constexpr uint32_t MINT = abi_encode_selector("mint(address,uint256)");
};

static_assert(Selector::BALANCE_OF == 0x70a08231);
static_assert(Selector::ALLOWANCE == 0xdd62ed3e);
static_assert(Selector::TOTAL_SUPPLY == 0x18160ddd);
static_assert(Selector::TRANSFER == 0xa9059cbb);
static_assert(Selector::APPROVE == 0x095ea7b3);
static_assert(Selector::TRANSFER_FROM == 0x23b872dd);
static_assert(Selector::MINT == 0x40c10f19);

// reads are two sloads, writes add two sstores and an event
constexpr uint64_t VIEW_OP_COST = 4200;
constexpr uint64_t APPROVE_OP_COST = 27000;
constexpr uint64_t TRANSFER_OP_COST = 35000;
constexpr uint64_t UNKNOWN_METHOD_OP_COST = 2100;

Result<void> function_not_payable(ExecutionFrame const &frame)
{
    if (SPLICE_UNLIKELY(frame.value != 0)) {
        return AssetError::ValueNonZero;
    }
    return outcome::success();
}

Result<void> function_writes(ExecutionFrame const &frame)
{
    BOOST_OUTCOME_TRY(function_not_payable(frame));
    if (SPLICE_UNLIKELY(frame.is_static())) {
        return AssetError::StaticModeViolation;
    }
    return outcome::success();
}

byte_string encode_true()
{
    AbiEncoder encoder;
    encoder.add_bool(true);
    return encoder.encode_final();
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

StorageVariable<u256_be> FungibleAsset::Variables::allowance(
    Address const &owner, Address const &spender)
{
    byte_string preimage;
    preimage.push_back(NSAllowance);
    preimage += byte_string_view{owner.bytes, sizeof(owner.bytes)};
    preimage += byte_string_view{spender.bytes, sizeof(spender.bytes)};
    return {state_, self_, to_bytes(keccak256(preimage))};
}

FungibleAsset::FungibleAsset(Address const &minter)
    : minter_{minter}
{
}

std::pair<FungibleAsset::PrecompileFunc, uint64_t>
FungibleAsset::dispatch(byte_string_view &input)
{
    if (SPLICE_UNLIKELY(input.size() < 4)) {
        return {&FungibleAsset::fallback, UNKNOWN_METHOD_OP_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case Selector::BALANCE_OF:
        return {&FungibleAsset::balance_of, VIEW_OP_COST};
    case Selector::ALLOWANCE:
        return {&FungibleAsset::allowance, VIEW_OP_COST};
    case Selector::TOTAL_SUPPLY:
        return {&FungibleAsset::total_supply, VIEW_OP_COST};
    case Selector::TRANSFER:
        return {&FungibleAsset::transfer, TRANSFER_OP_COST};
    case Selector::APPROVE:
        return {&FungibleAsset::approve, APPROVE_OP_COST};
    case Selector::TRANSFER_FROM:
        return {&FungibleAsset::transfer_from, TRANSFER_OP_COST};
    case Selector::MINT:
        return {&FungibleAsset::mint, TRANSFER_OP_COST};
    default:
        return {&FungibleAsset::fallback, UNKNOWN_METHOD_OP_COST};
    }
}

evmc::Result FungibleAsset::execute(Host &host, evmc_message const &msg)
{
    // the ledger lives in the deployed account, never in a borrowed one
    if (SPLICE_UNLIKELY(msg.kind != EVMC_CALL)) {
        return evmc::Result{EVMC_REJECTED};
    }

    byte_string_view input{msg.input_data, msg.input_size};
    auto const [method, cost] = dispatch(input);
    if (SPLICE_UNLIKELY(std::cmp_less(msg.gas, cost))) {
        return evmc::Result{EVMC_OUT_OF_GAS};
    }

    auto const frame = ExecutionFrame::from_message(msg, host.origin());
    auto const res = (this->*method)(host.state(), frame, input);
    if (SPLICE_LIKELY(res.has_value())) {
        return make_success_result(
            res.value(), msg.gas - static_cast<int64_t>(cost));
    }
    return make_error_result(
        res.error(), msg.gas - static_cast<int64_t>(cost));
}

void FungibleAsset::emit_transfer_event(
    State &state, Address const &asset, Address const &from,
    Address const &to, uint256_t const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Transfer(address,address,uint256)");
    static_assert(
        signature ==
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);

    auto const event = EventBuilder(asset, signature)
                           .add_topic(abi_encode_address(from))
                           .add_topic(abi_encode_address(to))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state.store_log(event);
}

void FungibleAsset::emit_approval_event(
    State &state, Address const &asset, Address const &owner,
    Address const &spender, uint256_t const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Approval(address,address,uint256)");
    static_assert(
        signature ==
        0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32);

    auto const event = EventBuilder(asset, signature)
                           .add_topic(abi_encode_address(owner))
                           .add_topic(abi_encode_address(spender))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state.store_log(event);
}

Result<void> FungibleAsset::move_balance(
    Variables &vars, Address const &from, Address const &to,
    uint256_t const &amount)
{
    auto from_balance = vars.balance(from);
    auto const available = from_balance.load().native();
    if (SPLICE_UNLIKELY(available < amount)) {
        return AssetError::InsufficientBalance;
    }
    from_balance.store(available - amount);

    // total supply bounds every balance, so the credit cannot overflow
    auto to_balance = vars.balance(to);
    to_balance.store(to_balance.load().native() + amount);
    return outcome::success();
}

Result<byte_string> FungibleAsset::balance_of(
    State &state, ExecutionFrame const &frame, byte_string_view input)
{
    BOOST_OUTCOME_TRY(function_not_payable(frame));
    BOOST_OUTCOME_TRY(auto const owner, abi_decode_fixed<Address>(input));
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AssetError::InvalidInput;
    }

    Variables vars{state, frame.storage_owner};
    AbiEncoder encoder;
    encoder.add_uint(vars.balance(owner).load());
    return encoder.encode_final();
}

Result<byte_string> FungibleAsset::allowance(
    State &state, ExecutionFrame const &frame, byte_string_view input)
{
    BOOST_OUTCOME_TRY(function_not_payable(frame));
    BOOST_OUTCOME_TRY(auto const owner, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const spender, abi_decode_fixed<Address>(input));
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AssetError::InvalidInput;
    }

    Variables vars{state, frame.storage_owner};
    AbiEncoder encoder;
    encoder.add_uint(vars.allowance(owner, spender).load());
    return encoder.encode_final();
}

Result<byte_string> FungibleAsset::total_supply(
    State &state, ExecutionFrame const &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(function_not_payable(frame));
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AssetError::InvalidInput;
    }

    Variables vars{state, frame.storage_owner};
    AbiEncoder encoder;
    encoder.add_uint(vars.total_supply.load());
    return encoder.encode_final();
}

Result<byte_string> FungibleAsset::transfer(
    State &state, ExecutionFrame const &frame, byte_string_view input)
{
    BOOST_OUTCOME_TRY(function_writes(frame));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AssetError::InvalidInput;
    }

    Variables vars{state, frame.storage_owner};
    BOOST_OUTCOME_TRY(move_balance(vars, frame.caller, to, amount.native()));
    emit_transfer_event(
        state, frame.storage_owner, frame.caller, to, amount.native());
    return encode_true();
}

Result<byte_string> FungibleAsset::approve(
    State &state, ExecutionFrame const &frame, byte_string_view input)
{
    BOOST_OUTCOME_TRY(function_writes(frame));
    BOOST_OUTCOME_TRY(auto const spender, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AssetError::InvalidInput;
    }

    Variables vars{state, frame.storage_owner};
    vars.allowance(frame.caller, spender).store(amount);
    emit_approval_event(
        state, frame.storage_owner, frame.caller, spender, amount.native());
    return encode_true();
}

Result<byte_string> FungibleAsset::transfer_from(
    State &state, ExecutionFrame const &frame, byte_string_view input)
{
    BOOST_OUTCOME_TRY(function_writes(frame));
    BOOST_OUTCOME_TRY(auto const from, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AssetError::InvalidInput;
    }

    Variables vars{state, frame.storage_owner};
    if (frame.caller != from) {
        auto allowance = vars.allowance(from, frame.caller);
        auto const allowed = allowance.load().native();
        if (SPLICE_UNLIKELY(allowed < amount.native())) {
            return AssetError::InsufficientAllowance;
        }
        // an unlimited approval is never drawn down
        if (allowed != std::numeric_limits<uint256_t>::max()) {
            allowance.store(allowed - amount.native());
        }
    }

    BOOST_OUTCOME_TRY(move_balance(vars, from, to, amount.native()));
    emit_transfer_event(state, frame.storage_owner, from, to, amount.native());
    return encode_true();
}

Result<byte_string> FungibleAsset::mint(
    State &state, ExecutionFrame const &frame, byte_string_view input)
{
    BOOST_OUTCOME_TRY(function_writes(frame));
    BOOST_OUTCOME_TRY(auto const to, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AssetError::InvalidInput;
    }
    if (SPLICE_UNLIKELY(frame.caller != minter_)) {
        return AssetError::NotMinter;
    }

    Variables vars{state, frame.storage_owner};
    auto const supply = vars.total_supply.load().native();
    if (SPLICE_UNLIKELY(
            std::numeric_limits<uint256_t>::max() - supply < amount.native())) {
        return AssetError::SupplyOverflow;
    }
    vars.total_supply.store(supply + amount.native());

    auto balance = vars.balance(to);
    balance.store(balance.load().native() + amount.native());

    LOG_DEBUG(
        "asset {} minted {} to {}", frame.storage_owner, amount.native(), to);
    emit_transfer_event(
        state, frame.storage_owner, Address{}, to, amount.native());
    return encode_true();
}

Result<byte_string>
FungibleAsset::fallback(State &, ExecutionFrame const &, byte_string_view)
{
    return AssetError::MethodNotSupported;
}

SPLICE_NAMESPACE_END
