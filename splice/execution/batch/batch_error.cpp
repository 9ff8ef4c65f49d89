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

#include <splice/execution/batch/batch_error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<splice::BatchError>::mapping> const &
quick_status_code_from_enum<splice::BatchError>::value_mappings()
{
    using splice::BatchError;

    static std::initializer_list<mapping> const v = {
        {BatchError::Success, "success", {errc::success}},
        {BatchError::TruncatedBatch, "truncated batch", {}},
        {BatchError::InvalidCallFlags, "invalid call flags", {}},
        {BatchError::TrailingBytes, "trailing bytes after batch", {}},
        {BatchError::InsufficientBudget, "insufficient budget", {}},
        {BatchError::SubCallReverted, "sub call reverted", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
