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
#include <splice/execution/core/contract/abi_signatures.hpp>

#include <cstdint>

SPLICE_NAMESPACE_BEGIN

// Deployed identities of the batch module and the injection router. Code
// running with one of these as its storage owner is running directly, not
// borrowed through a delegate call.
inline constexpr Address BATCH_MODULE_CA{0x5110};
inline constexpr Address INJECTION_ROUTER_CA{0x5111};

// Stands in for the chain's native asset wherever an asset address is taken.
inline constexpr Address NATIVE_ASSET =
    0xEeeeeEeeeEeEeeEeEeEeeEEEeeeeEeeeeeeeEEeE_address;

// Success sentinel slot is keccak256(SENTINEL_NAMESPACE || opHash) in the
// transient storage of the storage owner.
inline constexpr bytes32_t SENTINEL_NAMESPACE =
    abi_encode_event_signature("splice.success-sentinel");
static_assert(
    SENTINEL_NAMESPACE ==
    0xef074a4b0711311ebdb9bc11da4b0b130752228c63625d0da50be3a1eeaf69b5_bytes32);

inline constexpr bytes32_t SUCCESS_VALUE{1};

// Flat per-method costs. Sub-calls are paid for by the gas forwarded to them.
inline constexpr uint64_t HYDRATE_AND_EXECUTE_OP_COST = 10'000;
inline constexpr uint64_t HYDRATE_EXECUTE_AND_SWEEP_OP_COST = 15'000;
inline constexpr uint64_t SWEEP_OP_COST = 5'000;
inline constexpr uint64_t REFUND_AND_SWEEP_OP_COST = 8'000;
inline constexpr uint64_t VALIDATE_OP_HASH_AND_SWEEP_OP_COST = 5'200;
inline constexpr uint64_t RECORD_OP_SUCCESS_OP_COST = 200;
inline constexpr uint64_t INJECT_AND_CALL_OP_COST = 10'000;
inline constexpr uint64_t INJECT_SWEEP_AND_CALL_OP_COST = 14'000;
inline constexpr uint64_t FALLBACK_OP_COST = 2'100;

SPLICE_NAMESPACE_END
