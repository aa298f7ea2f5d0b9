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

#include <lockstake/core/assert.h>
#include <lockstake/core/config.hpp>

#include <cstddef>
#include <deque>
#include <utility>

LOCKSTAKE_NAMESPACE_BEGIN

// A value with one copy per open checkpoint. A copy is taken the first time
// the value is touched at a version newer than the top of the stack, so
// untouched values cost nothing when a checkpoint is opened or closed.
template <class T>
class VersionStack
{
    std::deque<std::pair<unsigned, T>> stack_{};

public:
    VersionStack(T value, unsigned version = 0)
    {
        stack_.emplace_back(version, std::move(value));
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    size_t size() const
    {
        return stack_.size();
    }

    unsigned version() const
    {
        LOCKSTAKE_ASSERT(stack_.size());

        return stack_.back().first;
    }

    T const &recent() const
    {
        LOCKSTAKE_ASSERT(stack_.size());

        return stack_.back().second;
    }

    T &current(unsigned const version)
    {
        LOCKSTAKE_ASSERT(stack_.size());

        if (version > stack_.back().first) {
            T value = stack_.back().second;
            stack_.emplace_back(version, std::move(value));
        }

        return stack_.back().second;
    }

    void pop_accept(unsigned const version)
    {
        LOCKSTAKE_ASSERT(version);

        auto const size = stack_.size();
        LOCKSTAKE_ASSERT(size);

        if (version == stack_.back().first) {
            if (size > 1 &&
                stack_[size - 2].first + 1 == stack_[size - 1].first) {
                stack_[size - 2].second = std::move(stack_[size - 1].second);
                stack_.pop_back();
            }
            else {
                stack_.back().first = version - 1;
            }
        }
    }

    // Returns true when nothing is left, i.e. the value did not exist before
    // the rejected version
    bool pop_reject(unsigned const version)
    {
        LOCKSTAKE_ASSERT(version);

        auto const size = stack_.size();
        LOCKSTAKE_ASSERT(size);

        if (version == stack_.back().first) {
            stack_.pop_back();
        }

        return stack_.empty();
    }
};

LOCKSTAKE_NAMESPACE_END
