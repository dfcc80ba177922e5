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

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <utility>
#include <vector>

LOCKSTAKE_NAMESPACE_BEGIN

// One value as seen through nested call checkpoints. The bottom layer holds
// the committed value; a checkpoint that writes the value gets its own layer
// on top, tagged with the checkpoint depth.
template <class T>
class VersionStack
{
    struct Layer
    {
        unsigned depth;
        T value;
    };

    std::vector<Layer> layers_{};

public:
    explicit VersionStack(T value, unsigned const depth = 0)
    {
        layers_.push_back(Layer{depth, std::move(value)});
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    T const &recent() const
    {
        LOCKSTAKE_ASSERT(!layers_.empty());

        return layers_.back().value;
    }

    // writable value for checkpoint `depth`, copied up on first write
    T &current(unsigned const depth)
    {
        LOCKSTAKE_ASSERT(!layers_.empty());

        if (layers_.back().depth < depth) {
            T copy = layers_.back().value;
            layers_.push_back(Layer{depth, std::move(copy)});
        }
        return layers_.back().value;
    }

    void pop_accept(unsigned const depth)
    {
        LOCKSTAKE_ASSERT(depth && !layers_.empty());

        if (layers_.back().depth != depth) {
            return;
        }
        auto const n = layers_.size();
        if (n > 1 && layers_[n - 2].depth == depth - 1) {
            layers_[n - 2].value = std::move(layers_[n - 1].value);
            layers_.pop_back();
            return;
        }
        // the enclosing checkpoint never wrote this value, it inherits the
        // layer
        layers_.back().depth = depth - 1;
    }

    // true when the value did not exist before checkpoint `depth`
    bool pop_reject(unsigned const depth)
    {
        LOCKSTAKE_ASSERT(depth && !layers_.empty());

        if (layers_.back().depth == depth) {
            layers_.pop_back();
        }
        return layers_.empty();
    }
};

// Keyed VersionStacks. A key first written inside a checkpoint disappears
// again when that checkpoint is rejected.
template <class Key, class T>
class VersionedMap
{
    ankerl::unordered_dense::segmented_map<Key, VersionStack<T>> entries_{};

public:
    T const *find(Key const &key) const
    {
        auto const it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        return &it->second.recent();
    }

    // writable entry for checkpoint `depth`; a missing key starts at `init`
    T &current(Key const &key, unsigned const depth, T const &init)
    {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            it = entries_.try_emplace(key, init, depth).first;
        }
        return it->second.current(depth);
    }

    void pop_accept(unsigned const depth)
    {
        for (auto &it : entries_) {
            it.second.pop_accept(depth);
        }
    }

    void pop_reject(unsigned const depth)
    {
        std::vector<Key> created;
        for (auto &it : entries_) {
            if (it.second.pop_reject(depth)) {
                created.push_back(it.first);
            }
        }
        for (auto const &key : created) {
            entries_.erase(key);
        }
    }

    // committed-or-pending view of every entry, ordered by key
    std::vector<std::pair<Key, T>> sorted() const
    {
        std::vector<std::pair<Key, T>> result;
        result.reserve(entries_.size());
        for (auto const &it : entries_) {
            result.emplace_back(it.first, it.second.recent());
        }
        std::sort(
            result.begin(), result.end(), [](auto const &a, auto const &b) {
                return a.first < b.first;
            });
        return result;
    }
};

LOCKSTAKE_NAMESPACE_END
