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

#include <splice/core/byte_string.hpp>
#include <splice/core/config.hpp>
#include <splice/core/int.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/core/address.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

SPLICE_NAMESPACE_BEGIN

// What the dispatcher does when a call fails.
enum class ErrorPolicy : uint8_t
{
    Revert = 0, // the whole batch fails with the call's output
    Abort = 1, // stop here, remaining calls are skipped
    Ignore = 2, // continue, and let the next fallback-only call run
    Fallthrough = 3, // continue
};

struct CallDescriptor
{
    Address target{};
    uint256_t native_amount{0};
    byte_string input{};
    uint256_t budget_cap{0}; // 0 is unlimited
    bool context_preserving{false};
    bool fallback_only{false};
    ErrorPolicy error_policy{ErrorPolicy::Revert};

    friend bool
    operator==(CallDescriptor const &, CallDescriptor const &) = default;
};

using CallBatch = std::vector<CallDescriptor>;

// the batch header counts calls in a single byte
inline constexpr size_t MAX_BATCH_CALLS = 255;

enum class CallStatus : uint8_t
{
    Succeeded = 0,
    Failed = 1,
    Skipped = 2,
};

struct CallResult
{
    CallStatus status{CallStatus::Skipped};
    byte_string output{};

    friend bool operator==(CallResult const &, CallResult const &) = default;
};

// batch := count:u8 call{count}
// call  := flags:u8 target:address [value:u256] [budget:u256] length:u32 input
//
// flags bit 0 context preserving, bit 1 fallback only, bits 2-3 error
// policy, bit 4 value present, bit 5 budget present. Bits 6-7 are reserved
// and must be zero.
namespace call_flags
{
    inline constexpr uint8_t CONTEXT_PRESERVING = 1 << 0;
    inline constexpr uint8_t FALLBACK_ONLY = 1 << 1;
    inline constexpr uint8_t POLICY_SHIFT = 2;
    inline constexpr uint8_t POLICY_MASK = 0b11 << POLICY_SHIFT;
    inline constexpr uint8_t HAS_VALUE = 1 << 4;
    inline constexpr uint8_t HAS_BUDGET = 1 << 5;
    inline constexpr uint8_t RESERVED = 0b11 << 6;
}

Result<CallBatch> decode_call_batch(byte_string_view);
byte_string encode_call_batch(CallBatch const &);

// results := count:u8 (status:u8 length:u32 output){count}
byte_string encode_call_results(std::vector<CallResult> const &);
Result<std::vector<CallResult>> decode_call_results(byte_string_view);

SPLICE_NAMESPACE_END
