#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

namespace peerdial {
namespace util {

/**
 * InsertionOrderedSet - set that remembers insertion order
 *
 * Purpose:
 * - FIFO pending queues keyed by id, with O(1) membership tests and removal
 *   from the middle (e.g. promoting a peer from the cold set to the hot set)
 *
 * Usage:
 *   InsertionOrderedSet<std::string> pending;
 *   pending.Insert("peer-a");
 *   pending.Insert("peer-b");
 *   pending.Erase("peer-a");
 *   auto next = pending.PopFront();  // "peer-b"
 *
 * Re-inserting an existing element keeps its original position.
 *
 * Not thread-safe: owned and mutated by a single reactor thread.
 */
template <typename T, typename Hash = std::hash<T>>
class InsertionOrderedSet {
public:
    InsertionOrderedSet() = default;

    InsertionOrderedSet(const InsertionOrderedSet&) = delete;
    InsertionOrderedSet& operator=(const InsertionOrderedSet&) = delete;

    /**
     * Insert element at the back
     * Returns true if inserted, false if already present
     */
    bool Insert(const T& value) {
        if (index_.count(value) > 0) {
            return false;
        }
        order_.push_back(value);
        index_.emplace(value, std::prev(order_.end()));
        return true;
    }

    /**
     * Remove element
     * Returns true if removed, false if it wasn't present
     */
    bool Erase(const T& value) {
        auto it = index_.find(value);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    bool Contains(const T& value) const {
        return index_.count(value) > 0;
    }

    // Oldest element, if any
    std::optional<T> Front() const {
        if (order_.empty()) {
            return std::nullopt;
        }
        return order_.front();
    }

    // Remove and return the oldest element, if any
    std::optional<T> PopFront() {
        if (order_.empty()) {
            return std::nullopt;
        }
        T value = order_.front();
        index_.erase(value);
        order_.pop_front();
        return value;
    }

    size_t Size() const { return order_.size(); }

    bool Empty() const { return order_.empty(); }

    void Clear() {
        index_.clear();
        order_.clear();
    }

    // Snapshot in insertion order
    std::vector<T> GetAll() const {
        return std::vector<T>(order_.begin(), order_.end());
    }

private:
    std::list<T> order_;
    std::unordered_map<T, typename std::list<T>::iterator, Hash> index_;
};

} // namespace util
} // namespace peerdial
