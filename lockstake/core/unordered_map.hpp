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

#include <lockstake/core/config.hpp>
#include <lockstake/core/int.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <functional>

LOCKSTAKE_NAMESPACE_BEGIN

//! \brief Hash arbitrary lengths of bytes into a `size_t`.
inline size_t hash_bytes(void const *p, size_t len) noexcept
{
    return size_t(ankerl::unordered_dense::detail::wyhash::hash(p, len));
}

/*! \brief Inline-storage hash map used for all registry mappings.

- References are NOT stable to modification.
- Segmented storage, so growth never moves existing values in bulk.
*/
template <
    class Key, class T, class Hash = ankerl::unordered_dense::hash<Key>,
    class Compare = std::equal_to<Key>>
using unordered_dense_map =
    ankerl::unordered_dense::segmented_map<Key, T, Hash, Compare>;

template <
    class Key, class Hash = ankerl::unordered_dense::hash<Key>,
    class Compare = std::equal_to<Key>>
using unordered_dense_set =
    ankerl::unordered_dense::segmented_set<Key, Hash, Compare>;

struct Uint256Hash
{
    using is_avalanching = void;

    size_t operator()(uint256_t const &value) const noexcept
    {
        return hash_bytes(&value, sizeof(value));
    }
};

LOCKSTAKE_NAMESPACE_END
