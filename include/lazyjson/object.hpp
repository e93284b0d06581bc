#pragma once

/// @file object.hpp
/// @brief Insertion-ordered member table with a lazy hash index.
///
/// Shared by the native representation (members are NativeValue) and the
/// lazy Value (members and overlay entries are ValuePtr). Members keep the
/// order in which they were first inserted; replacing a member keeps its
/// position. Tables at or above LAZYJSON_OBJECT_INDEX_THRESHOLD members
/// build a string_view -> position index on first lookup.

#include "config.hpp"
#include "detail/hash.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lazyjson {

template <typename V>
class basic_object {
public:
    using value_type   = std::pair<std::string, V>;
    using storage_type = std::vector<value_type>;
    using size_type    = size_t;
    using iterator       = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    /// Keys are views into entries_[i].first.
    using index_type = std::unordered_map<std::string_view, size_type,
                                          detail::StringHash,
                                          detail::StringEqual>;

    static constexpr size_type kIndexThreshold = LAZYJSON_OBJECT_INDEX_THRESHOLD;

    basic_object() = default;
    ~basic_object() = default;

    basic_object(std::initializer_list<value_type> init) {
        for (const auto& e : init) insert(e.first, e.second);
    }

    // The index holds views into the source entries, so copies start without one.
    basic_object(const basic_object& o) : entries_(o.entries_) {}
    basic_object(basic_object&& o) noexcept
        : entries_(std::move(o.entries_)), index_(std::move(o.index_)) {}

    basic_object& operator=(const basic_object& o) {
        if (this != &o) { entries_ = o.entries_; index_.reset(); }
        return *this;
    }
    basic_object& operator=(basic_object&& o) noexcept {
        if (this != &o) { entries_ = std::move(o.entries_); index_ = std::move(o.index_); }
        return *this;
    }

    // ─── Capacity ────────────────────────────────────────────────────────
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return entries_.size(); }
    void reserve(size_type n) {
        // Reallocation moves the keys the index points into.
        if (n > entries_.capacity()) index_.reset();
        entries_.reserve(n);
    }

    // ─── Iterators ──────────────────────────────────────────────────────
    iterator begin() noexcept { return entries_.begin(); }
    iterator end()   noexcept { return entries_.end(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end()   const noexcept { return entries_.end(); }

    // ─── Lookup ─────────────────────────────────────────────────────────

    /// O(1) for large tables, linear scan for small ones.
    V* find(std::string_view key) noexcept {
        const size_type pos = position(key);
        return pos == npos ? nullptr : &entries_[pos].second;
    }
    const V* find(std::string_view key) const noexcept {
        const size_type pos = position(key);
        return pos == npos ? nullptr : &entries_[pos].second;
    }

    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return position(key) != npos;
    }

    // ─── Modifiers ──────────────────────────────────────────────────────

    /// Replace the member in place, or append it.
    void insert(std::string key, V value) {
        const size_type pos = position(key);
        if (pos != npos) {
            entries_[pos].second = std::move(value);
            return;
        }
        push(std::move(key), std::move(value));
    }

    /// Remove a member. Returns false when the key was absent.
    bool erase(std::string_view key) {
        const size_type pos = position(key);
        if (pos == npos) return false;
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
        // Positions shifted; rebuilt lazily on the next lookup.
        index_.reset();
        return true;
    }

    void clear() noexcept {
        entries_.clear();
        index_.reset();
    }

    /// Member-order-insensitive comparison.
    bool operator==(const basic_object& other) const {
        if (size() != other.size()) return false;
        for (const auto& [key, val] : entries_) {
            const V* p = other.find(key);
            if (!p || !(*p == val)) return false;
        }
        return true;
    }
    bool operator!=(const basic_object& other) const { return !(*this == other); }

private:
    static constexpr size_type npos = static_cast<size_type>(-1);

    bool use_index() const noexcept { return entries_.size() >= kIndexThreshold; }

    size_type position(std::string_view key) const noexcept {
        if (use_index()) {
            if (!index_) rebuild_index();
            auto it = index_->find(key);
            return it == index_->end() ? npos : it->second;
        }
        for (size_type i = 0; i < entries_.size(); ++i)
            if (entries_[i].first == key) return i;
        return npos;
    }

    void rebuild_index() const {
        if (!index_) {
            index_ = std::make_unique<index_type>(entries_.size() * 2);
        } else {
            index_->clear();
        }
        for (size_type i = 0; i < entries_.size(); ++i)
            (*index_)[std::string_view(entries_[i].first)] = i;
    }

    void push(std::string key, V value) {
        const auto* old_data = entries_.data();
        entries_.emplace_back(std::move(key), std::move(value));
        if (!index_) return;
        if (entries_.data() != old_data) {
            // Reallocation: every view is dangling.
            rebuild_index();
        } else {
            index_->emplace(std::string_view(entries_.back().first), entries_.size() - 1);
        }
    }

    storage_type entries_;
    mutable std::unique_ptr<index_type> index_;
};

} // namespace lazyjson
