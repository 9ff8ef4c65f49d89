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
#include <splice/execution/batch/batch_dispatcher.hpp>
#include <splice/execution/batch/batch_error.hpp>
#include <splice/execution/batch/call_batch.hpp>
#include <splice/execution/batch/invocation_error.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_decode.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/host/contract.hpp>
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/hydration/hydration_error.hpp>
#include <splice/execution/hydration/hydration_interpreter.hpp>
#include <splice/execution/module/batch_module.hpp>
#include <splice/execution/module/constants.hpp>
#include <splice/execution/module/module_error.hpp>
#include <splice/execution/settlement/settlement.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <utility>
#include <vector>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

struct Selector
{
    static constexpr uint32_t HYDRATE_AND_EXECUTE =
        abi_encode_selector("hydrateAndExecute(bytes,bytes)");
    static constexpr uint32_t HYDRATE_EXECUTE_AND_SWEEP = abi_encode_selector(
        "hydrateExecuteAndSweep(bytes,bytes,address,address[],bool)");
    static constexpr uint32_t SWEEP =
        abi_encode_selector("sweep(address,address)");
    static constexpr uint32_t SWEEP_CAPPED =
        abi_encode_selector("sweep(address,address,uint256)");
    static constexpr uint32_t REFUND_AND_SWEEP =
        abi_encode_selector("refundAndSweep(address,address,uint256,address)");
    static constexpr uint32_t VALIDATE_OP_HASH_AND_SWEEP = abi_encode_selector(
        "validateOpHashAndSweep(bytes32,address,address)");
    static constexpr uint32_t RECORD_OP_SUCCESS =
        abi_encode_selector("recordOpSuccess(bytes32)");
};

static_assert(Selector::HYDRATE_AND_EXECUTE == 0x4157da71);
static_assert(Selector::HYDRATE_EXECUTE_AND_SWEEP == 0x80df36a0);
static_assert(Selector::SWEEP == 0xb8dc491b);
static_assert(Selector::SWEEP_CAPPED == 0x62c06767);
static_assert(Selector::REFUND_AND_SWEEP == 0x4784226e);
static_assert(Selector::VALIDATE_OP_HASH_AND_SWEEP == 0x2a3ee126);
static_assert(Selector::RECORD_OP_SUCCESS == 0xc62d9aaf);

struct ErrorSelector
{
    static constexpr uint32_t DELEGATE_CALL_NOT_ALLOWED =
        abi_encode_selector("DelegateCallNotAllowed(uint256)");
    static constexpr uint32_t UNKNOWN_VALUE_SOURCE =
        abi_encode_selector("UnknownValueSource(uint8)");
    static constexpr uint32_t UNKNOWN_DATA_KIND =
        abi_encode_selector("UnknownDataKind(uint8)");
};

static_assert(ErrorSelector::DELEGATE_CALL_NOT_ALLOWED == 0x230d1ccc);
static_assert(ErrorSelector::UNKNOWN_VALUE_SOURCE == 0x46d03572);
static_assert(ErrorSelector::UNKNOWN_DATA_KIND == 0xc6921a57);

// Selector of the custom error a parameterised failure reverts with, zero for
// the others.
template <class StatusCode>
uint32_t operand_error_selector(StatusCode const &error)
{
    if (error == InvocationError::DelegateCallNotAllowed) {
        return ErrorSelector::DELEGATE_CALL_NOT_ALLOWED;
    }
    if (error == HydrationError::UnknownValueSource) {
        return ErrorSelector::UNKNOWN_VALUE_SOURCE;
    }
    if (error == HydrationError::UnknownDataKind) {
        return ErrorSelector::UNKNOWN_DATA_KIND;
    }
    return 0;
}

Result<void> no_trailing_input(byte_string_view const head)
{
    if (SPLICE_UNLIKELY(!head.empty())) {
        return ModuleError::InvalidInput;
    }
    return outcome::success();
}

byte_string encode_amount(uint256_t const &amount)
{
    AbiEncoder encoder;
    encoder.add_uint(u256_be{amount});
    return encoder.encode_final();
}

// Decodes, hydrates and dispatches the batch. Every format and precondition
// error surfaces before the first call dispatches.
Result<std::vector<CallResult>> run_batch(
    InvocationGuard const &guard, Host &host, ExecutionFrame &frame,
    byte_string_view const batch_bytes, byte_string_view const program_bytes)
{
    BOOST_OUTCOME_TRY(auto calls, decode_call_batch(batch_bytes));
    BOOST_OUTCOME_TRY(guard.check_batch(frame, calls, &frame.error_operand));
    BOOST_OUTCOME_TRY(
        hydrate(host, frame, program_bytes, calls, &frame.error_operand));
    return dispatch_batch(host, frame, calls);
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

std::pair<BatchModule::PrecompileFunc, uint64_t>
BatchModule::dispatch(byte_string_view &input)
{
    if (SPLICE_UNLIKELY(input.size() < 4)) {
        return {&BatchModule::fallback, FALLBACK_OP_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case Selector::HYDRATE_AND_EXECUTE:
        return {&BatchModule::hydrate_and_execute, HYDRATE_AND_EXECUTE_OP_COST};
    case Selector::HYDRATE_EXECUTE_AND_SWEEP:
        return {
            &BatchModule::hydrate_execute_and_sweep,
            HYDRATE_EXECUTE_AND_SWEEP_OP_COST};
    case Selector::SWEEP:
        return {&BatchModule::sweep, SWEEP_OP_COST};
    case Selector::SWEEP_CAPPED:
        return {&BatchModule::sweep_capped, SWEEP_OP_COST};
    case Selector::REFUND_AND_SWEEP:
        return {&BatchModule::refund_and_sweep, REFUND_AND_SWEEP_OP_COST};
    case Selector::VALIDATE_OP_HASH_AND_SWEEP:
        return {
            &BatchModule::validate_op_hash_and_sweep,
            VALIDATE_OP_HASH_AND_SWEEP_OP_COST};
    case Selector::RECORD_OP_SUCCESS:
        return {&BatchModule::record_op_success, RECORD_OP_SUCCESS_OP_COST};
    default:
        return {&BatchModule::fallback, FALLBACK_OP_COST};
    }
}

evmc::Result BatchModule::execute(Host &host, evmc_message const &msg)
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
    // failed sub-calls bubble their own output
    if (res.error() == BatchError::SubCallReverted ||
        res.error() == AssetCallError::AssetTransferFailed) {
        return make_revert_result(host.return_data(), frame.gas_left);
    }
    if (auto const selector = operand_error_selector(res.error());
        selector != 0 && frame.error_operand.recorded) {
        AbiEncoder encoder;
        encoder.add_uint(u256_be{frame.error_operand.value});
        auto const output = abi_encode_call(selector, encoder.encode_final());
        return make_revert_result(output, frame.gas_left);
    }
    return make_error_result(res.error(), frame.gas_left);
}

Result<byte_string> BatchModule::hydrate_and_execute(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const batch_bytes, abi_decode_bytes(input, head));
    BOOST_OUTCOME_TRY(auto const program_bytes, abi_decode_bytes(input, head));

    BOOST_OUTCOME_TRY(
        auto const results,
        run_batch(guard_, host, frame, batch_bytes, program_bytes));
    return encode_call_results(results);
}

Result<byte_string> BatchModule::hydrate_execute_and_sweep(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const batch_bytes, abi_decode_bytes(input, head));
    BOOST_OUTCOME_TRY(auto const program_bytes, abi_decode_bytes(input, head));
    BOOST_OUTCOME_TRY(auto const sweep_target, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(
        auto const assets, abi_decode_address_array(input, head));
    BOOST_OUTCOME_TRY(auto const sweep_native, abi_decode_bool(head));

    BOOST_OUTCOME_TRY(
        auto const results,
        run_batch(guard_, host, frame, batch_bytes, program_bytes));

    auto const recipient =
        sweep_target == Address{} ? frame.caller : sweep_target;
    Settlement settlement{host, frame};
    for (auto const &asset : assets) {
        BOOST_OUTCOME_TRY(settlement.sweep(asset, recipient));
    }
    if (sweep_native) {
        BOOST_OUTCOME_TRY(settlement.sweep(NATIVE_ASSET, recipient));
    }
    return encode_call_results(results);
}

Result<byte_string> BatchModule::sweep(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(guard_.require_borrowed(frame));

    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const recipient, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(no_trailing_input(head));

    BOOST_OUTCOME_TRY(
        auto const amount, Settlement(host, frame).sweep(asset, recipient));
    return encode_amount(amount);
}

Result<byte_string> BatchModule::sweep_capped(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(guard_.require_borrowed(frame));

    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const recipient, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const cap, abi_decode_fixed<u256_be>(head));
    BOOST_OUTCOME_TRY(no_trailing_input(head));

    BOOST_OUTCOME_TRY(
        auto const amount,
        Settlement(host, frame).sweep(asset, recipient, cap.native()));
    return encode_amount(amount);
}

Result<byte_string> BatchModule::refund_and_sweep(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(guard_.require_borrowed(frame));

    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(
        auto const refund_recipient, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const refund_cap, abi_decode_fixed<u256_be>(head));
    BOOST_OUTCOME_TRY(
        auto const sweep_recipient, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(no_trailing_input(head));

    BOOST_OUTCOME_TRY(
        auto const split,
        Settlement(host, frame)
            .refund_and_sweep(
                asset, refund_recipient, refund_cap.native(), sweep_recipient));

    AbiEncoder encoder;
    encoder.add_uint(u256_be{split.refunded});
    encoder.add_uint(u256_be{split.remaining});
    return encoder.encode_final();
}

Result<byte_string> BatchModule::validate_op_hash_and_sweep(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(guard_.require_borrowed(frame));

    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const op_hash, abi_decode_fixed<bytes32_t>(head));
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const recipient, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(no_trailing_input(head));

    BOOST_OUTCOME_TRY(
        auto const amount,
        Settlement(host, frame)
            .validate_op_hash_and_sweep(op_hash, asset, recipient));
    return encode_amount(amount);
}

Result<byte_string> BatchModule::record_op_success(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(guard_.require_borrowed(frame));

    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const op_hash, abi_decode_fixed<bytes32_t>(head));
    BOOST_OUTCOME_TRY(no_trailing_input(head));

    Settlement(host, frame).record_success(op_hash);
    LOG_DEBUG("operation success recorded for {}", frame.storage_owner);
    return byte_string{};
}

Result<byte_string>
BatchModule::fallback(Host &, ExecutionFrame &, byte_string_view)
{
    return ModuleError::MethodNotSupported;
}

SPLICE_NAMESPACE_END
