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
#include <splice/execution/asset/asset_client.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/contract/events.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/bytes_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/module/constants.hpp>
#include <splice/execution/settlement/settlement.hpp>
#include <splice/execution/settlement/settlement_error.hpp>
#include <splice/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

constexpr bytes32_t SWEEP_EVENT =
    abi_encode_event_signature("Sweep(address,address,uint256)");
constexpr bytes32_t REFUND_EVENT =
    abi_encode_event_signature("Refund(address,address,uint256)");
constexpr bytes32_t ACTUAL_REFUND_EVENT =
    abi_encode_event_signature("ActualRefund(address,address,uint256,uint256)");
constexpr bytes32_t REFUND_AND_SWEEP_EVENT = abi_encode_event_signature(
    "RefundAndSweep(address,address,uint256,address,uint256,uint256)");

static_assert(
    SWEEP_EVENT ==
    0xed679328aebf74ede77ae09efcf36e90244f83643dadac1c2d9f0b21a46f6ab7_bytes32);
static_assert(
    REFUND_EVENT ==
    0xf40cc8c1a1d17359049ba500cfc894596a692cffc9d03943cd92ec2e159cf6ae_bytes32);
static_assert(
    ACTUAL_REFUND_EVENT ==
    0xbc530e98937a005fa590a15899ce2e21e1bfa93730e6dfe36bcd7a041d6abf85_bytes32);
static_assert(
    REFUND_AND_SWEEP_EVENT ==
    0xe8d24fc0ab3b12d83ce3d7bb06e74e2a423de5d1fa0d5414435460ede32ea6ea_bytes32);

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

bytes32_t sentinel_slot(bytes32_t const &op_hash)
{
    byte_string preimage;
    preimage += byte_string_view{
        SENTINEL_NAMESPACE.bytes, sizeof(SENTINEL_NAMESPACE.bytes)};
    preimage += byte_string_view{op_hash.bytes, sizeof(op_hash.bytes)};
    return to_bytes(keccak256(preimage));
}

Settlement::Settlement(Host &host, ExecutionFrame &frame)
    : host_{host}
    , frame_{frame}
{
}

Result<void> Settlement::pay(
    Address const &asset, Address const &to, uint256_t const &amount)
{
    if (amount == 0) {
        return outcome::success();
    }
    return transfer_asset(host_, frame_, asset, to, amount);
}

void Settlement::emit_sweep(
    Address const &asset, Address const &recipient, uint256_t const &amount)
{
    auto const event = EventBuilder(frame_.storage_owner, SWEEP_EVENT)
                           .add_topic(abi_encode_address(asset))
                           .add_topic(abi_encode_address(recipient))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    host_.state().store_log(event);
}

Result<uint256_t> Settlement::sweep(
    Address const &asset, Address const &recipient, uint256_t const &cap)
{
    BOOST_OUTCOME_TRY(
        auto const balance,
        query_balance(host_, frame_, asset, frame_.storage_owner));
    auto const amount = std::min(balance, cap);

    LOG_DEBUG(
        "sweep {} of {} from {} to {}",
        amount,
        asset,
        frame_.storage_owner,
        recipient);
    BOOST_OUTCOME_TRY(pay(asset, recipient, amount));
    emit_sweep(asset, recipient, amount);
    return amount;
}

Result<Settlement::RefundOutcome> Settlement::refund_and_sweep(
    Address const &asset, Address const &refund_recipient,
    uint256_t const &refund_cap, Address const &sweep_recipient)
{
    BOOST_OUTCOME_TRY(
        auto const balance,
        query_balance(host_, frame_, asset, frame_.storage_owner));
    RefundOutcome const split{
        .refunded = std::min(balance, refund_cap),
        .remaining = balance - std::min(balance, refund_cap),
    };

    auto &state = host_.state();
    if (refund_cap > balance) {
        LOG_DEBUG(
            "refund of {} capped to balance {} of {}",
            refund_cap,
            balance,
            asset);
        auto const event =
            EventBuilder(frame_.storage_owner, ACTUAL_REFUND_EVENT)
                .add_topic(abi_encode_address(asset))
                .add_topic(abi_encode_address(refund_recipient))
                .add_data(abi_encode_uint(u256_be{refund_cap}))
                .add_data(abi_encode_uint(u256_be{split.refunded}))
                .build();
        state.store_log(event);
    }

    LOG_DEBUG(
        "refund {} of {} to {}, sweep {} to {}",
        split.refunded,
        asset,
        refund_recipient,
        split.remaining,
        sweep_recipient);

    BOOST_OUTCOME_TRY(pay(asset, refund_recipient, split.refunded));
    auto const refund_event =
        EventBuilder(frame_.storage_owner, REFUND_EVENT)
            .add_topic(abi_encode_address(asset))
            .add_topic(abi_encode_address(refund_recipient))
            .add_data(abi_encode_uint(u256_be{split.refunded}))
            .build();
    state.store_log(refund_event);

    BOOST_OUTCOME_TRY(pay(asset, sweep_recipient, split.remaining));
    emit_sweep(asset, sweep_recipient, split.remaining);

    auto const event =
        EventBuilder(frame_.storage_owner, REFUND_AND_SWEEP_EVENT)
            .add_topic(abi_encode_address(asset))
            .add_topic(abi_encode_address(refund_recipient))
            .add_topic(abi_encode_address(sweep_recipient))
            .add_data(abi_encode_uint(u256_be{refund_cap}))
            .add_data(abi_encode_uint(u256_be{split.refunded}))
            .add_data(abi_encode_uint(u256_be{split.remaining}))
            .build();
    state.store_log(event);
    return split;
}

void Settlement::record_success(bytes32_t const &op_hash)
{
    host_.state().set_transient_storage(
        frame_.storage_owner, sentinel_slot(op_hash), SUCCESS_VALUE);
}

Result<void> Settlement::require_success(bytes32_t const &op_hash)
{
    auto const word = host_.state().get_transient_storage(
        frame_.storage_owner, sentinel_slot(op_hash));
    if (SPLICE_UNLIKELY(word != SUCCESS_VALUE)) {
        LOG_WARNING(
            "no success recorded for operation {} in {}",
            op_hash,
            frame_.storage_owner);
        return SettlementError::SuccessSentinelNotSet;
    }
    return outcome::success();
}

Result<uint256_t> Settlement::validate_op_hash_and_sweep(
    bytes32_t const &op_hash, Address const &asset, Address const &recipient)
{
    BOOST_OUTCOME_TRY(require_success(op_hash));
    return sweep(asset, recipient);
}

SPLICE_NAMESPACE_END
