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
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/asset/asset_call_error.hpp>
#include <splice/execution/asset/asset_client.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_decode.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/contract/events.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/bytes_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <splice/execution/host/contract.hpp>
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/module/constants.hpp>
#include <splice/execution/module/injection_error.hpp>
#include <splice/execution/module/injection_router.hpp>
#include <splice/execution/module/module_error.hpp>
#include <splice/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <cstring>
#include <utility>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

struct Selector
{
    static constexpr uint32_t INJECT_AND_CALL = abi_encode_selector(
        "injectAndCall(address,address,bytes,uint256,bytes32)");
    static constexpr uint32_t INJECT_SWEEP_AND_CALL = abi_encode_selector(
        "injectSweepAndCall(address,address,bytes,uint256,bytes32)");
};

static_assert(Selector::INJECT_AND_CALL == 0x5b5e6516);
static_assert(Selector::INJECT_SWEEP_AND_CALL == 0xc5e5153b);

constexpr uint32_t TARGET_CALL_FAILED =
    abi_encode_selector("TargetCallFailed(bytes)");
static_assert(TARGET_CALL_FAILED == 0xa932c97a);

constexpr bytes32_t AMOUNT_INJECTED_EVENT = abi_encode_event_signature(
    "AmountInjected(address,address,bytes32,uint256,uint256,bool,bytes)");
static_assert(
    AMOUNT_INJECTED_EVENT ==
    0x4f17b0e8ee22f81c727ec95c0bd3d8881338883d1479decb9ea8b040a44d1840_bytes32);

Result<Injection> decode_injection(byte_string_view const input)
{
    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const target, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const data, abi_decode_bytes(input, head));
    BOOST_OUTCOME_TRY(auto const offset, abi_decode_fixed<u256_be>(head));
    BOOST_OUTCOME_TRY(
        auto const placeholder, abi_decode_fixed<bytes32_t>(head));
    return Injection{
        .asset = asset,
        .target = target,
        .input = byte_string{data},
        .offset = offset.native(),
        .placeholder = placeholder,
    };
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

Result<byte_string>
inject_and_call(Host &host, ExecutionFrame &frame, Injection injection)
{
    bool const native = injection.asset == NATIVE_ASSET;
    BOOST_OUTCOME_TRY(
        auto const amount,
        query_balance(host, frame, injection.asset, frame.storage_owner));
    if (SPLICE_UNLIKELY(amount == 0)) {
        LOG_WARNING(
            "{} holds none of {} to inject",
            frame.storage_owner,
            injection.asset);
        return InjectionError::NoValueAvailable;
    }

    auto const &offset = injection.offset;
    if (SPLICE_UNLIKELY(
            offset > injection.input.size() ||
            injection.input.size() - offset < sizeof(bytes32_t))) {
        LOG_WARNING(
            "amount offset {} exceeds input of {} bytes",
            offset,
            injection.input.size());
        return InjectionError::AmountOffsetOutOfBounds;
    }
    uint8_t *const slot =
        injection.input.data() + static_cast<size_t>(offset);
    if (SPLICE_UNLIKELY(
            std::memcmp(
                slot, injection.placeholder.bytes, sizeof(bytes32_t)) != 0)) {
        LOG_WARNING(
            "input at offset {} does not hold placeholder {}",
            offset,
            injection.placeholder);
        return InjectionError::PlaceholderMismatch;
    }
    auto const word = intx::be::store<bytes32_t>(amount);
    std::memcpy(slot, word.bytes, sizeof(bytes32_t));

    if (!native) {
        BOOST_OUTCOME_TRY(
            approve_asset(host, frame, injection.asset, injection.target, amount));
    }

    auto const msg = make_call_message(
        frame,
        injection.target,
        native ? amount : uint256_t{0},
        injection.input,
        frame.gas_left);
    auto const result = host.call(msg);
    frame.consume_gas(msg.gas, result.gas_left);
    if (SPLICE_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        LOG_WARNING("injected call to {} failed", injection.target);
        return InjectionError::TargetCallFailed;
    }
    byte_string output{result.output_data, result.output_size};

    AbiEncoder data;
    data.add_uint(u256_be{amount});
    data.add_uint(u256_be{offset});
    data.add_bool(true);
    data.add_bytes(output);
    auto const event = EventBuilder(frame.storage_owner, AMOUNT_INJECTED_EVENT)
                           .add_topic(abi_encode_address(injection.asset))
                           .add_topic(abi_encode_address(injection.target))
                           .add_topic(injection.placeholder)
                           .add_data(data.encode_final())
                           .build();
    host.state().store_log(event);
    return output;
}

std::pair<InjectionRouter::PrecompileFunc, uint64_t>
InjectionRouter::dispatch(byte_string_view &input)
{
    if (SPLICE_UNLIKELY(input.size() < 4)) {
        return {&InjectionRouter::fallback, FALLBACK_OP_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case Selector::INJECT_AND_CALL:
        return {&InjectionRouter::inject_and_call, INJECT_AND_CALL_OP_COST};
    case Selector::INJECT_SWEEP_AND_CALL:
        return {
            &InjectionRouter::inject_sweep_and_call,
            INJECT_SWEEP_AND_CALL_OP_COST};
    default:
        return {&InjectionRouter::fallback, FALLBACK_OP_COST};
    }
}

evmc::Result InjectionRouter::execute(Host &host, evmc_message const &msg)
{
    byte_string_view input{msg.input_data, msg.input_size};
    auto const [method, cost] = dispatch(input);
    if (SPLICE_UNLIKELY(std::cmp_less(msg.gas, cost))) {
        return evmc::Result{EVMC_OUT_OF_GAS};
    }

    auto frame = ExecutionFrame::from_message(msg, host.origin());
    frame.gas_left -= static_cast<int64_t>(cost);

    auto const res = (this->*method)(host, frame, input);
    if (SPLICE_LIKELY(res.has_value())) {
        return make_success_result(res.value(), frame.gas_left);
    }
    if (res.error() == InjectionError::TargetCallFailed) {
        AbiEncoder encoder;
        encoder.add_bytes(host.return_data());
        auto const output =
            abi_encode_call(TARGET_CALL_FAILED, encoder.encode_final());
        return make_revert_result(output, frame.gas_left);
    }
    // the asset's own revert payload
    if (res.error() == AssetCallError::AssetTransferFailed ||
        res.error() == AssetCallError::AssetApprovalFailed) {
        return make_revert_result(host.return_data(), frame.gas_left);
    }
    return make_error_result(res.error(), frame.gas_left);
}

Result<byte_string> InjectionRouter::inject_and_call(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(auto injection, decode_injection(input));
    return splice::inject_and_call(host, frame, std::move(injection));
}

Result<byte_string> InjectionRouter::inject_sweep_and_call(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(auto injection, decode_injection(input));

    // native value arrives with the call itself
    if (injection.asset != NATIVE_ASSET) {
        BOOST_OUTCOME_TRY(
            auto const held,
            query_balance(host, frame, injection.asset, frame.caller));
        if (held != 0) {
            LOG_DEBUG(
                "pulling {} of {} from {}", held, injection.asset, frame.caller);
            BOOST_OUTCOME_TRY(transfer_asset_from(
                host,
                frame,
                injection.asset,
                frame.caller,
                frame.storage_owner,
                held));
        }
    }
    return splice::inject_and_call(host, frame, std::move(injection));
}

Result<byte_string>
InjectionRouter::fallback(Host &, ExecutionFrame &, byte_string_view)
{
    return ModuleError::MethodNotSupported;
}

SPLICE_NAMESPACE_END
