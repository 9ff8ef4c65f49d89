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
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/likely.h>
#include <splice/core/result.hpp>
#include <splice/execution/account/account_error.hpp>
#include <splice/execution/account/smart_account.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_decode.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/host/contract.hpp>
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <utility>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

struct Selector
{
    static constexpr uint32_t EXECUTE =
        abi_encode_selector("execute(address,uint256,bytes)");
    static constexpr uint32_t EXECUTE_DELEGATE =
        abi_encode_selector("executeDelegate(address,bytes)");
    static constexpr uint32_t OWNER = abi_encode_selector("owner()");
};

static_assert(Selector::EXECUTE == 0xb61d27f6);
static_assert(Selector::EXECUTE_DELEGATE == 0xb6b98c5d);
static_assert(Selector::OWNER == 0x8da5cb5b);

constexpr uint64_t EXECUTE_OP_COST = 2'600;
constexpr uint64_t OWNER_OP_COST = 200;
constexpr uint64_t RECEIVE_OP_COST = 0;
constexpr uint64_t UNKNOWN_METHOD_OP_COST = 2'100;

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

SmartAccount::SmartAccount(Address const &owner)
    : owner_{owner}
{
}

std::pair<SmartAccount::PrecompileFunc, uint64_t>
SmartAccount::dispatch(byte_string_view &input)
{
    if (input.empty()) {
        return {&SmartAccount::receive, RECEIVE_OP_COST};
    }
    if (SPLICE_UNLIKELY(input.size() < 4)) {
        return {&SmartAccount::fallback, UNKNOWN_METHOD_OP_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case Selector::EXECUTE:
        return {&SmartAccount::execute_call, EXECUTE_OP_COST};
    case Selector::EXECUTE_DELEGATE:
        return {&SmartAccount::execute_delegate, EXECUTE_OP_COST};
    case Selector::OWNER:
        return {&SmartAccount::owner, OWNER_OP_COST};
    default:
        return {&SmartAccount::fallback, UNKNOWN_METHOD_OP_COST};
    }
}

evmc::Result SmartAccount::execute(Host &host, evmc_message const &msg)
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
    if (res.error() == AccountError::InnerCallFailed) {
        return make_revert_result(host.return_data(), frame.gas_left);
    }
    return make_error_result(res.error(), frame.gas_left);
}

Result<void> SmartAccount::only_owner(ExecutionFrame const &frame) const
{
    if (SPLICE_UNLIKELY(frame.caller != owner_)) {
        LOG_WARNING(
            "account {} called by {}, owner is {}",
            frame.storage_owner,
            frame.caller,
            owner_);
        return AccountError::NotOwner;
    }
    return outcome::success();
}

Result<byte_string> SmartAccount::execute_call(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(only_owner(frame));

    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const target, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const value, abi_decode_fixed<u256_be>(head));
    BOOST_OUTCOME_TRY(auto const data, abi_decode_bytes(input, head));

    auto const msg = make_call_message(
        frame, target, value.native(), data, frame.gas_left);
    auto const result = host.call(msg);
    frame.consume_gas(msg.gas, result.gas_left);
    if (SPLICE_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        return AccountError::InnerCallFailed;
    }
    return byte_string{result.output_data, result.output_size};
}

Result<byte_string> SmartAccount::execute_delegate(
    Host &host, ExecutionFrame &frame, byte_string_view const input)
{
    BOOST_OUTCOME_TRY(only_owner(frame));

    byte_string_view head = input;
    BOOST_OUTCOME_TRY(auto const module, abi_decode_fixed<Address>(head));
    BOOST_OUTCOME_TRY(auto const data, abi_decode_bytes(input, head));

    evmc_message const msg{
        .kind = EVMC_DELEGATECALL,
        .flags = frame.flags,
        .depth = frame.depth + 1,
        .gas = frame.gas_left,
        .recipient = frame.storage_owner,
        .sender = frame.caller,
        .input_data = data.data(),
        .input_size = data.size(),
        .value = intx::be::store<evmc::uint256be>(frame.value),
        .create2_salt = {},
        .code_address = module,
        .code = nullptr,
        .code_size = 0,
    };
    auto const result = host.call(msg);
    frame.consume_gas(msg.gas, result.gas_left);
    if (SPLICE_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        return AccountError::InnerCallFailed;
    }
    return byte_string{result.output_data, result.output_size};
}

Result<byte_string> SmartAccount::owner(
    Host &, ExecutionFrame &, byte_string_view const input)
{
    if (SPLICE_UNLIKELY(!input.empty())) {
        return AccountError::InvalidInput;
    }
    AbiEncoder encoder;
    encoder.add_address(owner_);
    return encoder.encode_final();
}

Result<byte_string>
SmartAccount::receive(Host &, ExecutionFrame &, byte_string_view)
{
    return byte_string{};
}

Result<byte_string>
SmartAccount::fallback(Host &, ExecutionFrame &, byte_string_view)
{
    return AccountError::MethodNotSupported;
}

SPLICE_NAMESPACE_END
