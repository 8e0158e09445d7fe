// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ordered_map.h
/// @brief Insertion-ordered map keyed by canonical path strings.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace treepath {

/// Map from std::string to T that iterates in insertion order.
/// Re-assigning an existing key keeps its original position.
template <typename T>
class OrderedMap {
public:
    using value_type     = std::pair<std::string, T>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    void insert_or_assign(const std::string& key, T value) {
        auto [it, inserted] = index_.try_emplace(key, entries_.size());
        if (inserted) {
            entries_.emplace_back(key, std::move(value));
        } else {
            entries_[it->second].second = std::move(value);
        }
    }

    [[nodiscard]] const T* find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    /// @throws std::out_of_range if @p key is absent
    [[nodiscard]] const T& at(const std::string& key) const {
        if (auto* found = find(key)) {
            return *found;
        }
        throw std::out_of_range("No entry for " + key);
    }

    [[nodiscard]] bool contains(const std::string& key) const { return index_.count(key) > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    [[nodiscard]] std::vector<std::string> keys() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& [key, value] : entries_) {
            result.push_back(key);
        }
        return result;
    }

    bool operator==(const OrderedMap& other) const { return entries_ == other.entries_; }

private:
    std::vector<value_type> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace treepath
