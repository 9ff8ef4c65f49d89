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

#include <splice/core/config.hpp>
#include <splice/core/result.hpp>
#include <splice/execution/batch/call_batch.hpp>

#include <vector>

SPLICE_NAMESPACE_BEGIN

class Host;
struct ExecutionFrame;

// Executes the calls in order from the frame's storage owner. A fallback-only
// call runs only right after an ignored failure. On SubCallReverted the
// failing call's output is left in the host's return data.
Result<std::vector<CallResult>>
dispatch_batch(Host &, ExecutionFrame &, CallBatch const &);

SPLICE_NAMESPACE_END
