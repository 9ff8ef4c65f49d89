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
#include <splice/core/result.hpp>
#include <splice/execution/batch/call_batch.hpp>
#include <splice/execution/core/error_operand.hpp>
#include <splice/execution/hydration/hydration_program.hpp>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;
class ValueSampler;

// Writes sampled values into the calls of a batch. Every command is applied
// to a working copy; `calls` is replaced only if the whole program succeeds.
// Nothing is dispatched and no buffer changes size.
Result<void>
hydrate(ValueSampler &, HydrationProgram const &, CallBatch &calls);

// Decodes `program` completely before sampling anything.
Result<void> hydrate(
    Host &, ExecutionFrame &, byte_string_view program, CallBatch &calls,
    ErrorOperand *operand = nullptr);

SPLICE_NAMESPACE_END
