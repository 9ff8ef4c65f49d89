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
#include <splice/execution/asset/asset_call_error.hpp>
#include <splice/execution/asset/asset_client.hpp>
#include <splice/execution/core/address.hpp>
#include <splice/execution/core/contract/abi_decode.hpp>
#include <splice/execution/core/contract/abi_encode.hpp>
#include <splice/execution/core/contract/abi_signatures.hpp>
#include <splice/execution/core/contract/big_endian.hpp>
#include <splice/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <splice/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <splice/execution/host/execution_frame.hpp>
#include <splice/execution/host/host.hpp>
#include <splice/execution/module/constants.hpp>
#include <splice/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <optional>

SPLICE_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint32_t BALANCE_OF = abi_encode_selector("balanceOf(address)");
constexpr uint32_t ALLOWANCE =
    abi_encode_selector("allowance(address,address)");
constexpr uint32_t TRANSFER = abi_encode_selector("transfer(address,uint256)");
constexpr uint32_t TRANSFER_FROM =
    abi_encode_selector("transferFrom(address,address,uint256)");
constexpr uint32_t APPROVE = abi_encode_selector("approve(address,uint256)");

static_assert(BALANCE_OF == 0x70a08231);
static_assert(ALLOWANCE == 0xdd62ed3e);
static_assert(TRANSFER == 0xa9059cbb);
static_assert(TRANSFER_FROM == 0x23b872dd);
static_assert(APPROVE == 0x095ea7b3);

evmc::Result call_asset(
    Host &host, ExecutionFrame &frame, Address const &target,
    uint256_t const &value, byte_string_view const input,
    uint32_t const extra_flags = 0)
{
    auto const msg = make_call_message(
        frame, target, value, input, frame.gas_left, extra_flags);
    auto result = host.call(msg);
    frame.consume_gas(msg.gas, result.gas_left);
    return result;
}

// A single 32 byte word, as returned by balanceOf and allowance.
std::optional<uint256_t> decode_word(evmc::Result const &result)
{
    if (result.status_code != EVMC_SUCCESS || result.output_size != 32) {
        return std::nullopt;
    }
    byte_string_view output{result.output_data, result.output_size};
    auto const word = abi_decode_fixed<u256_be>(output);
    if (!word.has_value()) {
        return std::nullopt;
    }
    return word.value().native();
}

// Empty output counts as success for assets that return nothing; otherwise
// the output must decode to true.
bool call_accepted(evmc::Result const &result)
{
    if (result.status_code != EVMC_SUCCESS) {
        return false;
    }
    if (result.output_size == 0) {
        return true;
    }
    byte_string_view output{result.output_data, result.output_size};
    auto const accepted = abi_decode_bool(output);
    return accepted.has_value() && accepted.value();
}

SPLICE_ANONYMOUS_NAMESPACE_END

SPLICE_NAMESPACE_BEGIN

Result<uint256_t> query_balance(
    Host &host, ExecutionFrame &frame, Address const &asset,
    Address const &account)
{
    if (asset == NATIVE_ASSET) {
        return intx::be::load<uint256_t>(host.state().get_balance(account));
    }

    AbiEncoder encoder;
    encoder.add_address(account);
    auto const input = abi_encode_call(BALANCE_OF, encoder.encode_final());
    auto const result = call_asset(host, frame, asset, 0, input, EVMC_STATIC);
    auto const balance = decode_word(result);
    if (SPLICE_UNLIKELY(!balance.has_value())) {
        LOG_WARNING("asset {} did not answer balanceOf({})", asset, account);
        return AssetCallError::AssetQueryFailed;
    }
    return balance.value();
}

Result<uint256_t> query_allowance(
    Host &host, ExecutionFrame &frame, Address const &asset,
    Address const &owner, Address const &spender)
{
    // the native asset has no approvals
    if (asset == NATIVE_ASSET) {
        return uint256_t{0};
    }

    AbiEncoder encoder;
    encoder.add_address(owner);
    encoder.add_address(spender);
    auto const input = abi_encode_call(ALLOWANCE, encoder.encode_final());
    auto const result = call_asset(host, frame, asset, 0, input, EVMC_STATIC);
    auto const allowance = decode_word(result);
    if (SPLICE_UNLIKELY(!allowance.has_value())) {
        LOG_WARNING(
            "asset {} did not answer allowance({}, {})", asset, owner, spender);
        return AssetCallError::AssetQueryFailed;
    }
    return allowance.value();
}

Result<void> transfer_asset(
    Host &host, ExecutionFrame &frame, Address const &asset,
    Address const &to, uint256_t const &amount)
{
    if (asset == NATIVE_ASSET) {
        auto const result =
            call_asset(host, frame, to, amount, byte_string_view{});
        if (SPLICE_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
            LOG_WARNING("native transfer of {} to {} rejected", amount, to);
            return AssetCallError::NativeTransferFailed;
        }
        return outcome::success();
    }

    AbiEncoder encoder;
    encoder.add_address(to);
    encoder.add_uint(u256_be{amount});
    auto const input = abi_encode_call(TRANSFER, encoder.encode_final());
    auto const result = call_asset(host, frame, asset, 0, input);
    if (SPLICE_UNLIKELY(!call_accepted(result))) {
        return AssetCallError::AssetTransferFailed;
    }
    return outcome::success();
}

Result<void> transfer_asset_from(
    Host &host, ExecutionFrame &frame, Address const &asset,
    Address const &from, Address const &to, uint256_t const &amount)
{
    AbiEncoder encoder;
    encoder.add_address(from);
    encoder.add_address(to);
    encoder.add_uint(u256_be{amount});
    auto const input = abi_encode_call(TRANSFER_FROM, encoder.encode_final());
    auto const result = call_asset(host, frame, asset, 0, input);
    if (SPLICE_UNLIKELY(!call_accepted(result))) {
        return AssetCallError::AssetTransferFailed;
    }
    return outcome::success();
}

Result<void> approve_asset(
    Host &host, ExecutionFrame &frame, Address const &asset,
    Address const &spender, uint256_t const &amount)
{
    AbiEncoder encoder;
    encoder.add_address(spender);
    encoder.add_uint(u256_be{amount});
    auto const input = abi_encode_call(APPROVE, encoder.encode_final());
    auto const result = call_asset(host, frame, asset, 0, input);
    if (SPLICE_UNLIKELY(!call_accepted(result))) {
        return AssetCallError::AssetApprovalFailed;
    }
    return outcome::success();
}

SPLICE_NAMESPACE_END
