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
#include <lockstake/core/unordered_map.hpp>
#include <lockstake/core/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

// Mapping whose entries each carry their own VersionStack. An absent entry
// and an entry holding std::nullopt both read as "not present". Each open
// version remembers the keys it touched, so closing it only visits those.
template <
    class Key, class T, class Hash = ankerl::unordered_dense::hash<Key>>
class VersionedMap
{
    unordered_dense_map<Key, VersionStack<std::optional<T>>, Hash> slots_{};
    // touched_[v - 1] holds the keys written at version v
    std::vector<unordered_dense_set<Key, Hash>> touched_{};

    void touch(Key const &key, unsigned const version)
    {
        if (version == 0) {
            return;
        }
        if (touched_.size() < version) {
            touched_.resize(version);
        }
        touched_[version - 1].insert(key);
    }

    unordered_dense_set<Key, Hash> take_touched(unsigned const version)
    {
        LOCKSTAKE_ASSERT(version);

        if (touched_.size() < version) {
            return {};
        }
        auto keys = std::move(touched_[version - 1]);
        touched_.resize(version - 1);
        return keys;
    }

public:
    T const *find(Key const &key) const
    {
        auto const it = slots_.find(key);
        if (it == slots_.end() || !it->second.recent().has_value()) {
            return nullptr;
        }
        return &it->second.recent().value();
    }

    bool contains(Key const &key) const
    {
        return find(key) != nullptr;
    }

    std::optional<T> &current(Key const &key, unsigned const version)
    {
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            it = slots_.try_emplace(key, std::optional<T>{}, version).first;
        }
        touch(key, version);
        return it->second.current(version);
    }

    void set(Key const &key, T value, unsigned const version)
    {
        current(key, version) = std::move(value);
    }

    void erase(Key const &key, unsigned const version)
    {
        if (slots_.contains(key)) {
            current(key, version).reset();
        }
    }

    void pop_accept(unsigned const version)
    {
        for (auto const &key : take_touched(version)) {
            auto const it = slots_.find(key);
            LOCKSTAKE_ASSERT(it != slots_.end());
            auto &stack = it->second;
            stack.pop_accept(version);
            if (stack.size() == 1 && stack.version() == 0 &&
                !stack.recent().has_value()) {
                slots_.erase(it);
            }
            else {
                touch(key, version - 1);
            }
        }
    }

    void pop_reject(unsigned const version)
    {
        for (auto const &key : take_touched(version)) {
            auto const it = slots_.find(key);
            LOCKSTAKE_ASSERT(it != slots_.end());
            if (it->second.pop_reject(version)) {
                slots_.erase(it);
            }
        }
    }

    // Number of stored slots, including ones holding std::nullopt
    size_t slot_count() const
    {
        return slots_.size();
    }

    // Visits every present entry in unspecified order
    void for_each(std::function<void(Key const &, T const &)> const &f) const
    {
        for (auto const &[key, stack] : slots_) {
            if (stack.recent().has_value()) {
                f(key, stack.recent().value());
            }
        }
    }
};

LOCKSTAKE_NAMESPACE_END
